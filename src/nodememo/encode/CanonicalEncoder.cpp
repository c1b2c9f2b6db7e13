#include <nodememo/encode/CanonicalEncoder.hpp>

#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <array>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace NM::Encoding {

namespace {

using json = nlohmann::json;

constexpr double kMaxSafeInteger = 9007199254740991.0;

auto tagged(std::string_view type) -> json {
    json node = json::object();
    node[std::string{kTypeKey}] = std::string{type};
    return node;
}

auto unserializable([[maybe_unused]] std::string const& what) -> json {
    nm_log(describeError(make_error(what + ", using the sentinel", Error::Code::UnserializableType)), "Encoder");
    return json(std::string{kUnserializable});
}

auto encode_number(double number) -> json {
    if (std::isnan(number)) {
        auto node     = tagged("Number");
        node["value"] = "NaN";
        return node;
    }
    if (std::isinf(number)) {
        auto node     = tagged("Number");
        node["value"] = number > 0 ? "Infinity" : "-Infinity";
        return node;
    }
    if (std::trunc(number) == number && std::fabs(number) <= kMaxSafeInteger) {
        return json(static_cast<std::int64_t>(number));
    }
    return json(number);
}

auto describe_opaque(Opaque const& opaque) -> json {
    if (!opaque.describe) {
        return unserializable("opaque '" + opaque.typeName + "' has no description");
    }
    try {
        return json(opaque.describe());
    } catch (std::exception const& ex) {
        return unserializable("opaque '" + opaque.typeName + "' failed to describe itself: " + ex.what());
    }
}

/*
 * Builds the canonical document with an explicit frame stack, so the depth
 * of a graph is bounded by memory rather than by the call stack.
 *
 * A frame is pushed when a container is entered and gets its pre-order id
 * then; its children are visited in canonical order (sorted keys for
 * objects, sequence order otherwise, map entries flattened as key, value).
 * A container met again while its frame is still on the stack becomes a
 * circular marker.
 */
class Encoder {
public:
    auto run(Value const& root) -> json {
        json result;
        if (!enter(root, result)) {
            return result;
        }

        while (!frames_.empty()) {
            Frame& frame = frames_.back();
            if (frame.next == frame.children.size()) {
                json finished = finish(frame);
                onPath_.erase(frame.identity);
                frames_.pop_back();
                if (frames_.empty()) {
                    return finished;
                }
                attach(frames_.back(), std::move(finished));
                continue;
            }

            Value const& child = *frame.children[frame.next++];
            json         encoded;
            if (child.isUndefined()) {
                encoded = nullptr;
            } else if (enter(child, encoded)) {
                continue;
            }
            attach(frames_.back(), std::move(encoded));
        }
        return result;
    }

private:
    struct Frame {
        Value                           node; // keeps the container alive
        ValueKind                       kind = ValueKind::Object;
        void const*                     identity = nullptr;
        std::vector<Value const*>       children;
        std::vector<std::string const*> keys; // objects only, parallel to children
        std::size_t                     next      = 0;
        bool                            hasTagKey = false;
        json                            body;
    };

    // Encodes a leaf into `out`, or pushes a frame and returns true.
    auto enter(Value const& value, json& out) -> bool {
        try {
            switch (value.kind()) {
            case ValueKind::Object:
                return open(value, value.asObject(), out);
            case ValueKind::Array:
                return open(value, value.asArray(), out);
            case ValueKind::Map:
                return open(value, *value.getIf<MapRef>(), out);
            case ValueKind::Set:
                return open(value, *value.getIf<SetRef>(), out);
            default:
                out = encode_leaf(value);
                return false;
            }
        } catch (std::exception const& ex) {
            out = unserializable(std::string{kindName(value.kind())} + " threw while encoding: " + ex.what());
            return false;
        }
    }

    template <typename Container>
    auto open(Value const& value, std::shared_ptr<Container> const& container, json& out) -> bool {
        if (!container) {
            out = nullptr;
            return false;
        }
        if (auto it = onPath_.find(container.get()); it != onPath_.end()) {
            out        = tagged("Circular");
            out["ref"] = it->second;
            return false;
        }

        Frame frame;
        frame.node     = value;
        frame.kind     = value.kind();
        frame.identity = container.get();
        collect(*container, frame);
        onPath_.emplace(frame.identity, nextObjectId_++);
        frames_.push_back(std::move(frame));
        return true;
    }

    static auto collect(Object const& object, Frame& frame) -> void {
        std::vector<Object::Entry const*> sorted;
        sorted.reserve(object.entries.size());
        for (auto const& entry : object.entries) {
            if (!entry.second.isUndefined()) {
                sorted.push_back(&entry);
            }
        }
        std::stable_sort(sorted.begin(), sorted.end(), [](auto const* lhs, auto const* rhs) {
            return lhs->first < rhs->first;
        });
        for (auto const* entry : sorted) {
            if (entry->first == kTypeKey) {
                frame.hasTagKey = true;
            }
            frame.keys.push_back(&entry->first);
            frame.children.push_back(&entry->second);
        }
        frame.body = json::object();
    }

    static auto collect(Array const& array, Frame& frame) -> void {
        for (auto const& item : array.items) {
            frame.children.push_back(&item);
        }
        frame.body = json::array();
    }

    static auto collect(MapValue const& map, Frame& frame) -> void {
        for (auto const& [key, mapped] : map.entries) {
            frame.children.push_back(&key);
            frame.children.push_back(&mapped);
        }
        frame.body = json::array();
    }

    static auto collect(SetValue const& set, Frame& frame) -> void {
        for (auto const& item : set.values) {
            frame.children.push_back(&item);
        }
        frame.body = json::array();
    }

    static auto attach(Frame& frame, json child) -> void {
        auto const slot = frame.next - 1;
        switch (frame.kind) {
        case ValueKind::Object:
            frame.body[*frame.keys[slot]] = std::move(child);
            break;
        case ValueKind::Map:
            if (slot % 2 == 0) {
                frame.body.push_back(json::array());
            }
            frame.body.back().push_back(std::move(child));
            break;
        default:
            frame.body.push_back(std::move(child));
            break;
        }
    }

    static auto finish(Frame& frame) -> json {
        switch (frame.kind) {
        case ValueKind::Object: {
            if (!frame.hasTagKey) {
                return std::move(frame.body);
            }
            auto wrapper       = tagged("Object");
            wrapper["entries"] = std::move(frame.body);
            return wrapper;
        }
        case ValueKind::Map: {
            auto node       = tagged("Map");
            node["entries"] = std::move(frame.body);
            return node;
        }
        case ValueKind::Set: {
            auto node      = tagged("Set");
            node["values"] = std::move(frame.body);
            return node;
        }
        default:
            return std::move(frame.body);
        }
    }

    auto encode_leaf(Value const& value) -> json {
        switch (value.kind()) {
        case ValueKind::Undefined:
            return tagged("Undefined");
        case ValueKind::Null:
            return json(nullptr);
        case ValueKind::Boolean:
            return json(value.asBool());
        case ValueKind::Number:
            return encode_number(value.asNumber());
        case ValueKind::String:
            return json(value.asString());
        case ValueKind::BigInt: {
            auto node     = tagged("BigInt");
            node["value"] = value.getIf<BigInt>()->digits;
            return node;
        }
        case ValueKind::Date: {
            auto node     = tagged("Date");
            node["value"] = formatIsoDate(*value.getIf<Date>());
            return node;
        }
        case ValueKind::RegExp: {
            auto const& regexp = *value.getIf<RegExp>();
            auto        node   = tagged("RegExp");
            node["source"]     = regexp.source;
            node["flags"]      = regexp.flags;
            return node;
        }
        case ValueKind::Symbol: {
            auto const& symbol = *value.getIf<SymbolRef>();
            auto        node   = tagged("Symbol");
            node["key"]        = symbol ? symbol->description : std::string{};
            return node;
        }
        case ValueKind::Function: {
            auto const& function = value.asFunction();
            auto [it, inserted]  = functionIds_.try_emplace(function.get(), nextFunctionId_);
            if (inserted) {
                ++nextFunctionId_;
            }
            auto node    = tagged("Function");
            node["name"] = function ? function->name : std::string{};
            node["id"]   = it->second;
            return node;
        }
        case ValueKind::Opaque: {
            auto const& opaque = *value.getIf<OpaqueRef>();
            if (!opaque) {
                return unserializable("null opaque value");
            }
            return describe_opaque(*opaque);
        }
        default:
            break;
        }
        return unserializable(std::string{"unexpected "} + std::string{kindName(value.kind())} + " leaf");
    }

    std::vector<Frame>                              frames_;
    phmap::flat_hash_map<void const*, std::int64_t> onPath_;
    phmap::flat_hash_map<void const*, std::int64_t> functionIds_;
    std::int64_t                                    nextObjectId_   = 0;
    std::int64_t                                    nextFunctionId_ = 0;
};

// Serializes a document the way json::dump(indent) does, without recursing
// per nesting level. Scalars and keys go through json::dump itself.
auto write_document(json const& document, int indent) -> std::string {
    struct Cursor {
        json const*                node;
        json::const_iterator       it;
    };

    std::string         out;
    std::vector<Cursor> stack;

    auto scalar = [&out](json const& node) {
        out += node.dump(-1, ' ', false, json::error_handler_t::replace);
    };
    auto newline = [&out, indent](std::size_t depth) {
        if (indent >= 0) {
            out.push_back('\n');
            out.append(depth * static_cast<std::size_t>(indent), ' ');
        }
    };
    auto open = [&](json const& node) {
        if (!node.is_structured()) {
            scalar(node);
            return;
        }
        if (node.empty()) {
            out += node.is_object() ? "{}" : "[]";
            return;
        }
        out.push_back(node.is_object() ? '{' : '[');
        stack.push_back(Cursor{&node, node.cbegin()});
    };

    open(document);
    while (!stack.empty()) {
        auto& top = stack.back();
        if (top.it == top.node->cend()) {
            bool const isObject = top.node->is_object();
            stack.pop_back();
            newline(stack.size());
            out.push_back(isObject ? '}' : ']');
            continue;
        }
        if (top.it != top.node->cbegin()) {
            out.push_back(',');
        }
        newline(stack.size());
        if (top.node->is_object()) {
            scalar(json(top.it.key()));
            out += indent >= 0 ? ": " : ":";
        }
        json const& child = *top.it;
        ++top.it;
        open(child);
    }
    return out;
}

auto string_field(json const& node, char const* name) -> std::optional<std::string> {
    auto it = node.find(name);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

auto make_placeholder(std::string name, std::int64_t id) -> FunctionRef {
    auto label = (name.empty() ? std::string{"anonymous"} : name) + "#" + std::to_string(id);
    return makeFunction(std::move(name), [label](Value const&) -> Value {
        throw std::logic_error("Function placeholder called: " + label);
    });
}

// Tagged leaves. Containers (Map, Set, Object) and malformed tags are
// handled by the Decoder.
auto decode_tagged_leaf(json const& node, std::string const& type, std::vector<Value> const& containers)
    -> std::optional<Value> {
    if (type == "Function") {
        auto name = string_field(node, "name").value_or(std::string{});
        auto id   = node.contains("id") && node["id"].is_number_integer() ? node["id"].get<std::int64_t>() : -1;
        return Value{make_placeholder(std::move(name), id)};
    }
    if (type == "Symbol") {
        if (auto key = string_field(node, "key")) {
            return Value{makeSymbol(std::move(*key))};
        }
        return std::nullopt;
    }
    if (type == "BigInt") {
        if (auto digits = string_field(node, "value")) {
            return Value{BigInt{std::move(*digits)}};
        }
        return std::nullopt;
    }
    if (type == "Date") {
        if (auto text = string_field(node, "value")) {
            if (auto date = parseIsoDate(*text)) {
                return Value{*date};
            }
        }
        return std::nullopt;
    }
    if (type == "RegExp") {
        auto source = string_field(node, "source");
        auto flags  = string_field(node, "flags");
        if (source && flags) {
            return Value{RegExp{std::move(*source), std::move(*flags)}};
        }
        return std::nullopt;
    }
    if (type == "Number") {
        auto text = string_field(node, "value");
        if (!text) {
            return std::nullopt;
        }
        if (*text == "NaN") {
            return Value{std::nan("")};
        }
        if (*text == "Infinity") {
            return Value{HUGE_VAL};
        }
        if (*text == "-Infinity") {
            return Value{-HUGE_VAL};
        }
        return std::nullopt;
    }
    if (type == "Undefined") {
        return Value{};
    }
    if (type == "Circular") {
        auto it = node.find("ref");
        if (it == node.end() || !it->is_number_integer()) {
            return std::nullopt;
        }
        auto ref = it->get<std::int64_t>();
        if (ref < 0 || static_cast<std::size_t>(ref) >= containers.size()) {
            return std::nullopt;
        }
        return containers[static_cast<std::size_t>(ref)];
    }
    return std::nullopt;
}

/*
 * Inverse of Encoder, also on an explicit frame stack. Containers are
 * registered in pre-order as they are created, which is the numbering the
 * circular markers refer to.
 */
class Decoder {
public:
    auto run(json const& document) -> Value {
        Value result;
        if (!enter(document, result)) {
            return result;
        }

        while (!frames_.empty()) {
            Frame& frame = frames_.back();
            if (frame.next == frame.children.size()) {
                Value finished = std::move(frame.container);
                frames_.pop_back();
                if (frames_.empty()) {
                    return finished;
                }
                attach(frames_.back(), std::move(finished));
                continue;
            }

            json const& child = *frame.children[frame.next++];
            Value       decoded;
            if (enter(child, decoded)) {
                continue;
            }
            attach(frames_.back(), std::move(decoded));
        }
        return result;
    }

private:
    struct Frame {
        Value                           container;
        ValueKind                       kind = ValueKind::Object;
        std::vector<json const*>        children;
        std::vector<std::string const*> keys; // objects only
        std::size_t                     next = 0;
        Value                           pendingKey; // maps only
    };

    auto enter(json const& node, Value& out) -> bool {
        switch (node.type()) {
        case json::value_t::null:
            out = Value{nullptr};
            return false;
        case json::value_t::boolean:
            out = Value{node.get<bool>()};
            return false;
        case json::value_t::number_integer:
            out = Value{static_cast<double>(node.get<std::int64_t>())};
            return false;
        case json::value_t::number_unsigned:
            out = Value{static_cast<double>(node.get<std::uint64_t>())};
            return false;
        case json::value_t::number_float:
            out = Value{node.get<double>()};
            return false;
        case json::value_t::string:
            out = Value{node.get<std::string>()};
            return false;
        case json::value_t::array:
            open_array(node);
            return true;
        case json::value_t::object:
            return enter_object(node, out);
        case json::value_t::binary:
        case json::value_t::discarded:
            break;
        }
        out = Value{std::string{kUnserializable}};
        return false;
    }

    auto enter_object(json const& node, Value& out) -> bool {
        auto type = string_field(node, std::string{kTypeKey}.c_str());
        if (!type) {
            open_object(node);
            return true;
        }
        if (*type == "Map" || *type == "Set" || *type == "Object") {
            auto const* field = *type == "Set" ? "values" : "entries";
            auto        it    = node.find(field);
            bool const  valid = it != node.end() && (*type == "Object" ? it->is_object() : it->is_array());
            if (!valid) {
                open_object(node);
            } else if (*type == "Map") {
                open_map(*it);
            } else if (*type == "Set") {
                open_set(*it);
            } else {
                open_object(*it);
            }
            return true;
        }
        if (auto decoded = decode_tagged_leaf(node, *type, containers_)) {
            out = std::move(*decoded);
            return false;
        }
        open_object(node);
        return true;
    }

    auto push(Value container, ValueKind kind) -> Frame& {
        containers_.push_back(container);
        Frame frame;
        frame.container = std::move(container);
        frame.kind      = kind;
        frames_.push_back(std::move(frame));
        return frames_.back();
    }

    auto open_object(json const& members) -> void {
        auto& frame = push(Value{std::make_shared<Object>()}, ValueKind::Object);
        for (auto it = members.begin(); it != members.end(); ++it) {
            frame.keys.push_back(&it.key());
            frame.children.push_back(&it.value());
        }
    }

    auto open_array(json const& items) -> void {
        auto& frame = push(Value{std::make_shared<Array>()}, ValueKind::Array);
        for (auto const& item : items) {
            frame.children.push_back(&item);
        }
    }

    auto open_map(json const& entries) -> void {
        auto& frame = push(Value{std::make_shared<MapValue>()}, ValueKind::Map);
        for (auto const& pair : entries) {
            if (pair.is_array() && pair.size() == 2) {
                frame.children.push_back(&pair[0]);
                frame.children.push_back(&pair[1]);
            }
        }
    }

    auto open_set(json const& values) -> void {
        auto& frame = push(Value{std::make_shared<SetValue>()}, ValueKind::Set);
        for (auto const& item : values) {
            frame.children.push_back(&item);
        }
    }

    static auto attach(Frame& frame, Value child) -> void {
        auto const slot = frame.next - 1;
        switch (frame.kind) {
        case ValueKind::Object:
            frame.container.asObject()->entries.emplace_back(*frame.keys[slot], std::move(child));
            break;
        case ValueKind::Array:
            frame.container.asArray()->items.push_back(std::move(child));
            break;
        case ValueKind::Map:
            if (slot % 2 == 0) {
                frame.pendingKey = std::move(child);
            } else {
                (*frame.container.getIf<MapRef>())->entries.emplace_back(std::move(frame.pendingKey), std::move(child));
            }
            break;
        case ValueKind::Set:
            (*frame.container.getIf<SetRef>())->values.push_back(std::move(child));
            break;
        default:
            break;
        }
    }

    std::vector<Frame> frames_;
    std::vector<Value> containers_; // indexed by pre-order id
};

auto parse_fixed(std::string_view text, std::size_t offset, std::size_t width, int& out) -> bool {
    if (offset + width > text.size()) {
        return false;
    }
    auto const* first  = text.data() + offset;
    auto const* last   = first + width;
    auto        result = std::from_chars(first, last, out);
    return result.ec == std::errc{} && result.ptr == last;
}

auto to_base36(std::uint32_t value) -> std::string {
    constexpr std::string_view digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) {
        return "0";
    }
    std::string out;
    while (value > 0) {
        out.push_back(digits[value % 36u]);
        value /= 36u;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace

auto toCanonicalJson(Value const& value) -> nlohmann::json {
    Encoder encoder;
    return encoder.run(value);
}

auto encode(Value const& value, EncodeOptions const& options) -> Signature {
    auto document = toCanonicalJson(value);
    return write_document(document, options.indent);
}

auto fromCanonicalJson(nlohmann::json const& document) -> Value {
    Decoder decoder;
    return decoder.run(document);
}

auto decode(std::string_view signature) -> Expected<Value> {
    auto document = nlohmann::json::parse(signature, nullptr, false);
    if (document.is_discarded()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "signature is not valid JSON"});
    }
    return fromCanonicalJson(document);
}

auto hashString(std::string_view text) -> std::string {
    std::uint32_t fnv = 2166136261u;
    std::uint32_t djb = 5381u;
    for (unsigned char ch : text) {
        fnv ^= ch;
        fnv *= 16777619u;
        djb = (djb * 33u) ^ ch;
    }
    return to_base36(fnv) + "_" + to_base36(djb);
}

auto formatIsoDate(Date const& date) -> std::string {
    using namespace std::chrono;
    auto const dayPoint = floor<days>(date.time);
    year_month_day const ymd{dayPoint};
    hh_mm_ss<milliseconds> const tod{date.time - dayPoint};

    std::array<char, 48> buffer{};
    auto written = std::snprintf(buffer.data(),
                                 buffer.size(),
                                 "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                                 static_cast<int>(ymd.year()),
                                 static_cast<unsigned>(ymd.month()),
                                 static_cast<unsigned>(ymd.day()),
                                 static_cast<int>(tod.hours().count()),
                                 static_cast<int>(tod.minutes().count()),
                                 static_cast<int>(tod.seconds().count()),
                                 static_cast<int>(tod.subseconds().count()));
    if (written <= 0) {
        return std::string{kUnserializable};
    }
    return std::string{buffer.data(), static_cast<std::size_t>(written)};
}

auto parseIsoDate(std::string_view text) -> std::optional<Date> {
    // YYYY-MM-DDTHH:MM:SS[.mmm]Z
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' || text[13] != ':'
        || text[16] != ':' || text.back() != 'Z') {
        return std::nullopt;
    }
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    if (!parse_fixed(text, 0, 4, year) || !parse_fixed(text, 5, 2, month) || !parse_fixed(text, 8, 2, day)
        || !parse_fixed(text, 11, 2, hour) || !parse_fixed(text, 14, 2, minute)
        || !parse_fixed(text, 17, 2, second)) {
        return std::nullopt;
    }
    if (text.size() == 24) {
        if (text[19] != '.' || !parse_fixed(text, 20, 3, millis)) {
            return std::nullopt;
        }
    } else if (text.size() != 20) {
        return std::nullopt;
    }
    using namespace std::chrono;
    year_month_day const ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 59) {
        return std::nullopt;
    }
    auto time = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second} + milliseconds{millis};
    return Date{time_point_cast<milliseconds>(time)};
}

} // namespace NM::Encoding
