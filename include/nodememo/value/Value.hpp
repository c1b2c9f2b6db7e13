#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace NM {

class Value;
struct Object;
struct Array;
struct Function;
struct Symbol;
struct MapValue;
struct SetValue;
struct Opaque;

using ObjectRef   = std::shared_ptr<Object>;
using ArrayRef    = std::shared_ptr<Array>;
using FunctionRef = std::shared_ptr<Function const>;
using SymbolRef   = std::shared_ptr<Symbol const>;
using MapRef      = std::shared_ptr<MapValue>;
using SetRef      = std::shared_ptr<SetValue>;
using OpaqueRef   = std::shared_ptr<Opaque const>;

struct Undefined {
    auto operator==(Undefined const&) const -> bool = default;
};

struct BigInt {
    std::string digits;
    auto operator==(BigInt const&) const -> bool = default;
};

struct Date {
    std::chrono::sys_time<std::chrono::milliseconds> time{};
    auto operator==(Date const&) const -> bool = default;
};

struct RegExp {
    std::string source;
    std::string flags;
    auto operator==(RegExp const&) const -> bool = default;
};

// Order matches the alternatives of Value::Storage.
enum class ValueKind : std::uint8_t {
    Undefined,
    Null,
    Boolean,
    Number,
    String,
    BigInt,
    Date,
    RegExp,
    Symbol,
    Function,
    Object,
    Array,
    Map,
    Set,
    Opaque
};

[[nodiscard]] auto kindName(ValueKind kind) -> std::string_view;

/**
 * Value: one node of a property graph.
 *
 * Scalars (undefined, null, booleans, numbers, strings, bigints, dates and
 * regular expressions) are held by value. Objects, arrays, functions,
 * symbols, maps, sets and opaque host values are held by shared_ptr and
 * carry identity: two Values referring to the same container compare equal
 * under same(), two structurally equal containers do not.
 *
 * A container may hold itself (directly or through descendants). Such
 * graphs keep themselves alive; callers that build cycles break them when
 * they are done with the graph.
 */
class Value {
public:
    using Storage = std::variant<Undefined,
                                 std::nullptr_t,
                                 bool,
                                 double,
                                 std::string,
                                 BigInt,
                                 Date,
                                 RegExp,
                                 SymbolRef,
                                 FunctionRef,
                                 ObjectRef,
                                 ArrayRef,
                                 MapRef,
                                 SetRef,
                                 OpaqueRef>;

    Value() = default;
    Value(Undefined) {}
    Value(std::nullptr_t) : storage_(nullptr) {}
    Value(bool flag) : storage_(flag) {}
    template <typename T>
        requires(std::is_arithmetic_v<T> && !std::is_same_v<T, bool>)
    Value(T number) : storage_(static_cast<double>(number)) {}
    Value(char const* text) : storage_(std::string{text}) {}
    Value(std::string text) : storage_(std::move(text)) {}
    Value(std::string_view text) : storage_(std::string{text}) {}
    Value(BigInt value) : storage_(std::move(value)) {}
    Value(Date value) : storage_(value) {}
    Value(RegExp value) : storage_(std::move(value)) {}
    Value(SymbolRef value) : storage_(std::move(value)) {}
    Value(FunctionRef value) : storage_(std::move(value)) {}
    Value(ObjectRef value) : storage_(std::move(value)) {}
    Value(ArrayRef value) : storage_(std::move(value)) {}
    Value(MapRef value) : storage_(std::move(value)) {}
    Value(SetRef value) : storage_(std::move(value)) {}
    Value(OpaqueRef value) : storage_(std::move(value)) {}

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(storage_.index());
    }

    [[nodiscard]] auto isUndefined() const noexcept -> bool { return kind() == ValueKind::Undefined; }
    [[nodiscard]] auto isNull() const noexcept -> bool { return kind() == ValueKind::Null; }
    [[nodiscard]] auto isString() const noexcept -> bool { return kind() == ValueKind::String; }
    [[nodiscard]] auto isNumber() const noexcept -> bool { return kind() == ValueKind::Number; }
    [[nodiscard]] auto isObject() const noexcept -> bool { return kind() == ValueKind::Object; }
    [[nodiscard]] auto isArray() const noexcept -> bool { return kind() == ValueKind::Array; }
    [[nodiscard]] auto isFunction() const noexcept -> bool { return kind() == ValueKind::Function; }

    // Objects and arrays: the containers the resolver descends into.
    [[nodiscard]] auto isContainer() const noexcept -> bool { return isObject() || isArray(); }

    template <typename T>
    [[nodiscard]] auto getIf() const noexcept -> T const* {
        return std::get_if<T>(&storage_);
    }

    [[nodiscard]] auto asString() const -> std::string const&;
    [[nodiscard]] auto asNumber() const -> double;
    [[nodiscard]] auto asBool() const -> bool;
    [[nodiscard]] auto asObject() const -> ObjectRef const&;
    [[nodiscard]] auto asArray() const -> ArrayRef const&;
    [[nodiscard]] auto asFunction() const -> FunctionRef const&;

    // Address of the referenced entity for reference kinds, nullptr for scalars.
    [[nodiscard]] auto identity() const noexcept -> void const*;

    [[nodiscard]] auto storage() const noexcept -> Storage const& { return storage_; }

    // Strict equality: scalars by value, reference kinds by identity.
    [[nodiscard]] static auto same(Value const& lhs, Value const& rhs) -> bool;

private:
    Storage storage_;
};

struct Object {
    using Entry = std::pair<std::string, Value>;

    Object() = default;
    Object(std::initializer_list<Entry> init) : entries(init) {}

    [[nodiscard]] auto find(std::string_view key) -> Value*;
    [[nodiscard]] auto find(std::string_view key) const -> Value const*;
    [[nodiscard]] auto get(std::string_view key) const -> Value;
    [[nodiscard]] auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }
    auto set(std::string key, Value value) -> void;
    auto erase(std::string_view key) -> bool;
    [[nodiscard]] auto size() const noexcept -> std::size_t { return entries.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return entries.empty(); }

    std::vector<Entry> entries; // insertion order
};

struct Array {
    Array() = default;
    Array(std::initializer_list<Value> init) : items(init) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return items.size(); }

    std::vector<Value> items;
};

struct Function {
    using Callable = std::function<Value(Value const&)>;

    std::string name;
    Callable    call;

    // Throws std::bad_function_call when no callable is bound.
    auto invoke(Value const& argument) const -> Value;
};

struct Symbol {
    std::string description;
};

struct MapValue {
    std::vector<std::pair<Value, Value>> entries;
};

struct SetValue {
    std::vector<Value> values;
};

// Host value the graph carries but does not understand. describe() supplies
// its canonical text; without it (or when it throws) encoding falls back to
// the unserializable sentinel.
struct Opaque {
    std::string                  typeName;
    std::function<std::string()> describe;
};

[[nodiscard]] auto makeObject(std::initializer_list<Object::Entry> init = {}) -> ObjectRef;
[[nodiscard]] auto makeArray(std::initializer_list<Value> init = {}) -> ArrayRef;
[[nodiscard]] auto makeFunction(std::string name, Function::Callable call) -> FunctionRef;
[[nodiscard]] auto makeSymbol(std::string description) -> SymbolRef;
[[nodiscard]] auto makeMap(std::vector<std::pair<Value, Value>> entries = {}) -> MapRef;
[[nodiscard]] auto makeSet(std::vector<Value> values = {}) -> SetRef;
[[nodiscard]] auto makeOpaque(std::string typeName, std::function<std::string()> describe = {}) -> OpaqueRef;
[[nodiscard]] auto makeDate(std::int64_t millisecondsSinceEpoch) -> Date;

// JavaScript-compatible number text: shortest round-trip digits, "NaN",
// "Infinity", "-Infinity", and no trailing ".0" for integral values.
[[nodiscard]] auto formatNumber(double number) -> std::string;

} // namespace NM
