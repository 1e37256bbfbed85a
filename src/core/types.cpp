#include "core/types.hpp"

// Value types are header-only; this unit pins their layout assumptions.

namespace ladle {

static_assert(sizeof(Uuid) == 16, "Uuid should be 16 bytes");
static_assert(std::is_trivially_copyable_v<Uuid>, "Uuid should be trivially copyable");
static_assert(std::is_trivially_copyable_v<Timestamp>, "Timestamp should be trivially copyable");
static_assert(sizeof(Timestamp) == sizeof(int64_t), "Timestamp is stored as epoch millis");

} // namespace ladle
