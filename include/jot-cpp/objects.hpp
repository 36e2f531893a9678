/// @file objects.hpp
/// @brief Convenience operations on object properties.
///
/// Each is a thin composition of Apply with Set, Copy and Paste, so the
/// results compose and rebase like any other operation.
///
/// @note `remove` and `rename` share their names with the C library file
/// functions from `<cstdio>`. With string literal arguments and a
/// `using namespace jot_cpp;` at global scope, the unqualified call picks
/// `::remove(const char*)`. Qualify the calls as `jot_cpp::remove` and
/// `jot_cpp::rename`.

#pragma once

#include <jot-cpp/op.hpp>
#include <jot-cpp/value.hpp>

#include <string>

namespace jot_cpp {

/// Create or replace a property: `Apply(key, Set(value))`.
///
/// @code
/// put("k", 10).apply(Value::object());   // {"k": 10}
/// @endcode
auto put(std::string key, Value value) -> Operation;

/// Remove a property: `Apply(key, Set(missing()))`.
auto remove(std::string key) -> Operation;

/// Rename a property, keeping its value.
///
/// Expressed as a Clipboard around a List of three steps: copy the value at
/// `old_key`, remove `old_key`, and paste the copied value at `new_key`.
/// @throws Exception (invalid_argument) if the keys are equal or empty.
auto rename(std::string old_key, std::string new_key) -> Operation;

}  // namespace jot_cpp
