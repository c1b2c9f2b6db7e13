#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace NM {

using StableKey = std::string;

// The explicit key when one is given, otherwise a hash of the element type and
// the structural position, so the same slot maps to the same key on every render.
[[nodiscard]] auto derive_stable_key(std::string_view elementType,
                                     std::string_view position,
                                     std::optional<std::string> const& explicitKey = std::nullopt) -> StableKey;

// Position of the index-th child below `parentPosition` ("root" -> "root_0").
[[nodiscard]] auto child_position(std::string_view parentPosition, std::size_t index) -> std::string;

} // namespace NM
