/// @file value.hpp
/// @brief Document values, the MISSING sentinel, and small helpers.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <variant>

namespace jot_cpp {

/// A document or a part of one: a scalar, an array, or an object.
///
/// Documents are plain values. Operations never hold a reference to the
/// document they are applied to; they produce a new value instead.
using Value = nlohmann::json;

/// The MISSING sentinel: "this property does not exist".
///
/// It is distinct from every representable document value, null included.
/// It is passed to a sub-operation when its key is absent, and an Apply
/// deletes a key whose sub-operation evaluates to it.
auto missing() -> const Value&;

/// Check if a value is the MISSING sentinel.
inline auto is_missing(const Value& v) -> bool {
    return v.is_discarded();
}

/// Deep equality that also treats MISSING as equal to itself.
auto values_equal(const Value& a, const Value& b) -> bool;

/// A strict total order over values (MISSING sorts first).
/// Used wherever a deterministic tie-break between two values is needed.
auto value_less(const Value& a, const Value& b) -> bool;

/// Human-readable form of a value; MISSING prints as "MISSING".
auto to_string(const Value& v) -> std::string;

/// A key into an object (string) or an index into a sequence (size_t).
using Prop = std::variant<std::string, std::size_t>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Set& s) { ... },
///     [](const auto&) { ... },
/// }, op.variant());
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jot_cpp
