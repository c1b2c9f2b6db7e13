#pragma once

#include <nodememo/core/Error.hpp>
#include <nodememo/value/Value.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace NM::Encoding {

using Signature = std::string;

inline constexpr std::string_view kUnserializable = "<unserializable>";
inline constexpr std::string_view kTypeKey        = "$type";

struct EncodeOptions {
    // Passed to nlohmann::json::dump; -1 gives the compact form used for keys.
    int indent = -1;
};

/**
 * Canonical encoding of a property graph.
 *
 * - Object keys are emitted in sorted order, array order is preserved, so
 *   key insertion order never changes the result.
 * - Objects, arrays, maps and sets receive ids in pre-order of that sorted
 *   traversal. A container met again while it is still on the current
 *   descent path is written as {"$type":"Circular","ref":id}; traversal
 *   always terminates.
 * - Special leaves carry a "$type" tag: Function (name + per-call id by
 *   identity), Symbol, BigInt, Date, RegExp, Map, Set, Number (non-finite),
 *   Undefined (top level only) and Object (a user object that itself owns a
 *   "$type" key).
 * - Leaves that cannot be described encode as kUnserializable.
 * - Neither direction recurses per nesting level; graphs nested hundreds of
 *   thousands of levels deep encode and decode.
 */
[[nodiscard]] auto toCanonicalJson(Value const& value) -> nlohmann::json;

[[nodiscard]] auto encode(Value const& value, EncodeOptions const& options = {}) -> Signature;

// Inverse of toCanonicalJson. Unknown or malformed tags pass through as plain
// objects; functions become placeholders that throw std::logic_error when
// invoked; circular markers are re-linked to the ancestor carrying the id.
[[nodiscard]] auto fromCanonicalJson(nlohmann::json const& document) -> Value;

// Parses a signature. Fails only when the text is not JSON.
[[nodiscard]] auto decode(std::string_view signature) -> Expected<Value>;

// FNV-1a and djb2 over the bytes of text, rendered as "<fnv36>_<djb36>".
[[nodiscard]] auto hashString(std::string_view text) -> std::string;

[[nodiscard]] auto formatIsoDate(Date const& date) -> std::string;
[[nodiscard]] auto parseIsoDate(std::string_view text) -> std::optional<Date>;

} // namespace NM::Encoding
