/// @file value.hpp
/// @brief The document value type and JSON-semantic helpers.

#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace spatch {

/// A JSON document or subtree.
///
/// nlohmann::ordered_json keeps object members in insertion order, which
/// makes diff output deterministic for a given pair of inputs.
using Value = nlohmann::ordered_json;

/// Check if a Value is a valid identity value: boolean, number or string.
inline auto is_scalar(const Value& v) noexcept -> bool {
    return v.is_boolean() || v.is_number() || v.is_string();
}

/// Check if a Value is an object or an array.
inline auto is_container(const Value& v) noexcept -> bool {
    return v.is_object() || v.is_array();
}

/// The JSON kind of a value: "null", "boolean", "number", "string",
/// "array" or "object".
auto kind_name(const Value& v) noexcept -> std::string_view;

/// Short description of a value for error messages, e.g. `string("foo")`,
/// `number(42)`, `object`.
auto describe(const Value& v) -> std::string;

/// JSON-semantic deep equality.
///
/// Object members compare regardless of order, numbers compare by value
/// (1 == 1.0), and values of different kinds are never equal ("1" != 1,
/// true != 1). Uses an explicit worklist, so arbitrarily deep documents do
/// not grow the call stack.
auto equal(const Value& a, const Value& b) -> bool;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Key& k) { ... },
///     [](const Index& i) { ... },
///     [](const auto&) { ... },
/// }, segment);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace spatch
