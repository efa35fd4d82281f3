/// @file value.hpp
/// @brief Value model: a tagged variant over the six JSON kinds.

#pragma once

#include <concepts>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator<=>(const Null&) const = default;
    auto operator==(const Null&) const -> bool = default;
};

/// A JSON number, stored as the exact text of its source token.
///
/// No conversion to a binary floating point type ever happens, so
/// `9999999999999999` or `1.10` survive a parse/dump round-trip
/// unchanged. Two numbers are equal only if their texts are equal.
struct Number {
    std::string text;  ///< The number token, e.g. "-12.5e3".

    auto operator==(const Number&) const -> bool = default;
};

struct Value;

/// An ordered sequence of values.
using Array = std::vector<Value>;

/// A mapping from string keys to values. Iteration is in key order.
using Object = std::map<std::string, Value>;

/// The six kinds of JSON values, in variant index order.
enum class ValueKind : std::uint8_t {
    null,
    boolean,
    number,
    string,
    array,
    object,
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:    return "null";
        case ValueKind::boolean: return "boolean";
        case ValueKind::number:  return "number";
        case ValueKind::string:  return "string";
        case ValueKind::array:   return "array";
        case ValueKind::object:  return "object";
    }
    return "unknown";
}

/// A parsed JSON value.
///
/// Alternatives: Null, bool, Number, string, Array, Object. The
/// alternative order matches ValueKind.
struct Value {
    using Variant = std::variant<Null, bool, Number, std::string, Array, Object>;

    Variant data;  ///< The active alternative.

    Value() : data{Null{}} {}
    Value(Null) : data{Null{}} {}
    Value(bool b) : data{b} {}
    Value(Number n) : data{std::move(n)} {}
    Value(std::string s) : data{std::move(s)} {}
    Value(std::string_view s) : data{std::string{s}} {}
    Value(const char* s) : data{std::string{s}} {}
    Value(Array a) : data{std::move(a)} {}
    Value(Object o) : data{std::move(o)} {}

    /// Integers are stored as their decimal text.
    template <std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T i) : data{Number{std::to_string(i)}} {}

    auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(data.index());
    }

    auto is_null() const noexcept -> bool { return kind() == ValueKind::null; }
    auto is_array() const noexcept -> bool { return kind() == ValueKind::array; }
    auto is_object() const noexcept -> bool { return kind() == ValueKind::object; }

    /// True for arrays and objects.
    auto is_container() const noexcept -> bool {
        return is_array() || is_object();
    }

    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data); }
};

/// Deep, type-strict equality.
///
/// Values of different kinds are never equal. Objects are equal when
/// they have the same key set and pointwise-equal values, independent
/// of insertion order. Arrays are equal when they have the same length
/// and equal elements at every index.
auto operator==(const Value& a, const Value& b) -> bool;

/// True when both values hold the same alternative.
inline auto same_kind(const Value& a, const Value& b) noexcept -> bool {
    return a.data.index() == b.data.index();
}

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& s) { std::printf("%s\n", s.c_str()); },
///     [](const Number& n) { std::printf("%s\n", n.text.c_str()); },
///     [](const auto&) { std::printf("other\n"); },
/// }, value.data);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
