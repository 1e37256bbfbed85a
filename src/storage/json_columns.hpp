#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace ladle::storage {

// List-valued columns are stored as JSON arrays of strings.

[[nodiscard]] std::string encode_string_list(const std::vector<std::string>& values);
[[nodiscard]] Result<std::vector<std::string>, Error> decode_string_list(std::string_view json);

[[nodiscard]] std::string encode_uuid_list(const std::vector<Uuid>& values);
[[nodiscard]] Result<std::vector<Uuid>, Error> decode_uuid_list(std::string_view json);

} // namespace ladle::storage
