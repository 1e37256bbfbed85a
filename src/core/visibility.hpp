#pragma once

#include <string>
#include <string_view>

namespace ladle {

/**
 * Visibility - Which remote partitions hold a copy of an entity.
 *
 * Private entities live only in the owner's private partition. Public
 * entities are additionally copied to the shared public partition.
 */
enum class Visibility {
    Private,
    Public
};

[[nodiscard]] inline std::string to_string(Visibility v) {
    return v == Visibility::Public ? "public" : "private";
}

/**
 * Unknown stored values fall back to private so a bad row never leaks
 * an entity into the public partition.
 */
[[nodiscard]] inline Visibility visibility_from_string(std::string_view s) {
    return s == "public" ? Visibility::Public : Visibility::Private;
}

} // namespace ladle
