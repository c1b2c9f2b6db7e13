#include <nodememo/value/Value.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <stdexcept>
#include <system_error>

namespace NM {

namespace {

auto wrong_kind(ValueKind expected, ValueKind actual) -> std::logic_error {
    std::string message{"value is "};
    message.append(kindName(actual));
    message.append(", expected ");
    message.append(kindName(expected));
    return std::logic_error{message};
}

template <typename T>
auto require_alternative(Value const& value, ValueKind expected) -> T const& {
    if (auto const* held = value.getIf<T>()) {
        return *held;
    }
    throw wrong_kind(expected, value.kind());
}

} // namespace

auto kindName(ValueKind kind) -> std::string_view {
    switch (kind) {
    case ValueKind::Undefined:
        return "undefined";
    case ValueKind::Null:
        return "null";
    case ValueKind::Boolean:
        return "boolean";
    case ValueKind::Number:
        return "number";
    case ValueKind::String:
        return "string";
    case ValueKind::BigInt:
        return "bigint";
    case ValueKind::Date:
        return "date";
    case ValueKind::RegExp:
        return "regexp";
    case ValueKind::Symbol:
        return "symbol";
    case ValueKind::Function:
        return "function";
    case ValueKind::Object:
        return "object";
    case ValueKind::Array:
        return "array";
    case ValueKind::Map:
        return "map";
    case ValueKind::Set:
        return "set";
    case ValueKind::Opaque:
        return "opaque";
    }
    return "unknown";
}

auto Value::asString() const -> std::string const& {
    return require_alternative<std::string>(*this, ValueKind::String);
}

auto Value::asNumber() const -> double {
    return require_alternative<double>(*this, ValueKind::Number);
}

auto Value::asBool() const -> bool {
    return require_alternative<bool>(*this, ValueKind::Boolean);
}

auto Value::asObject() const -> ObjectRef const& {
    return require_alternative<ObjectRef>(*this, ValueKind::Object);
}

auto Value::asArray() const -> ArrayRef const& {
    return require_alternative<ArrayRef>(*this, ValueKind::Array);
}

auto Value::asFunction() const -> FunctionRef const& {
    return require_alternative<FunctionRef>(*this, ValueKind::Function);
}

auto Value::identity() const noexcept -> void const* {
    return std::visit(
        [](auto const& held) -> void const* {
            using T = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<T, SymbolRef> || std::is_same_v<T, FunctionRef>
                          || std::is_same_v<T, ObjectRef> || std::is_same_v<T, ArrayRef>
                          || std::is_same_v<T, MapRef> || std::is_same_v<T, SetRef>
                          || std::is_same_v<T, OpaqueRef>) {
                return static_cast<void const*>(held.get());
            } else {
                return nullptr;
            }
        },
        storage_);
}

auto Value::same(Value const& lhs, Value const& rhs) -> bool {
    if (lhs.storage_.index() != rhs.storage_.index()) {
        return false;
    }
    if (lhs.kind() >= ValueKind::Symbol) {
        return lhs.identity() == rhs.identity();
    }
    return std::visit(
        [&rhs](auto const& held) -> bool {
            using T = std::decay_t<decltype(held)>;
            if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, std::nullptr_t>) {
                return true;
            } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, double>
                                 || std::is_same_v<T, std::string> || std::is_same_v<T, BigInt>
                                 || std::is_same_v<T, Date> || std::is_same_v<T, RegExp>) {
                return held == *rhs.getIf<T>();
            } else {
                return false;
            }
        },
        lhs.storage_);
}

auto Object::find(std::string_view key) -> Value* {
    for (auto& entry : entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

auto Object::find(std::string_view key) const -> Value const* {
    for (auto const& entry : entries) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

auto Object::get(std::string_view key) const -> Value {
    if (auto const* value = find(key)) {
        return *value;
    }
    return Value{};
}

auto Object::set(std::string key, Value value) -> void {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return;
    }
    entries.emplace_back(std::move(key), std::move(value));
}

auto Object::erase(std::string_view key) -> bool {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) {
            entries.erase(it);
            return true;
        }
    }
    return false;
}

auto Function::invoke(Value const& argument) const -> Value {
    return call(argument);
}

auto makeObject(std::initializer_list<Object::Entry> init) -> ObjectRef {
    return std::make_shared<Object>(init);
}

auto makeArray(std::initializer_list<Value> init) -> ArrayRef {
    return std::make_shared<Array>(init);
}

auto makeFunction(std::string name, Function::Callable call) -> FunctionRef {
    return std::make_shared<Function const>(Function{std::move(name), std::move(call)});
}

auto makeSymbol(std::string description) -> SymbolRef {
    return std::make_shared<Symbol const>(Symbol{std::move(description)});
}

auto makeMap(std::vector<std::pair<Value, Value>> entries) -> MapRef {
    auto map     = std::make_shared<MapValue>();
    map->entries = std::move(entries);
    return map;
}

auto makeSet(std::vector<Value> values) -> SetRef {
    auto set    = std::make_shared<SetValue>();
    set->values = std::move(values);
    return set;
}

auto makeOpaque(std::string typeName, std::function<std::string()> describe) -> OpaqueRef {
    return std::make_shared<Opaque const>(Opaque{std::move(typeName), std::move(describe)});
}

auto makeDate(std::int64_t millisecondsSinceEpoch) -> Date {
    return Date{std::chrono::sys_time<std::chrono::milliseconds>{std::chrono::milliseconds{millisecondsSinceEpoch}}};
}

auto formatNumber(double number) -> std::string {
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    if (number == 0.0) {
        return "0";
    }
    std::array<char, 64> buffer{};
    auto result = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number);
    if (result.ec != std::errc{}) {
        return std::to_string(number);
    }
    return std::string{buffer.data(), result.ptr};
}

} // namespace NM
