/// @file random.hpp
/// @brief Random documents and random valid operations, for randomized tests.
///
/// Every generated operation is valid for the document it was generated
/// against: applying it never throws.

#pragma once

#include <jot-cpp/op.hpp>
#include <jot-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <random>

namespace jot_cpp {

/// The random engine used by the generators.
using RandomEngine = std::mt19937_64;

/// Tuning knobs for the generators.
struct RandomOptions {
    std::size_t max_depth{3};        ///< Maximum nesting of generated values.
    std::size_t key_space{1000};     ///< New keys are drawn from k0 .. k<key_space - 1>.
    std::int64_t min_integer{-100};  ///< Smallest generated integer.
    std::int64_t max_integer{100};   ///< Largest generated integer.
};

/// Where the value being edited lives, which decides whether it can be
/// removed.
enum class RandomContext : std::uint8_t {
    root,      ///< A top-level document.
    property,  ///< The value of an object property.
};

/// A random document: null, a boolean, an integer, a string, or a small
/// array or object nested up to `options.max_depth`.
auto random_value(RandomEngine& rng, const RandomOptions& options = {}) -> Value;

/// A random edit of an object.
///
/// Chooses uniformly between putting a key `k<n>` with a random value,
/// renaming an existing key to `k<n>`, copying an existing key's value to
/// `k<n>` and, for each existing key, recursing into that key's value. An
/// empty object always gets a put.
/// @throws Exception (type_mismatch) if `document` is not an object.
auto random_object_operation(const Value& document, RandomEngine& rng,
                             const RandomOptions& options = {}) -> Operation;

/// A random edit of any value: a Set, arithmetic on numbers, removal of an
/// object property, or an object edit.
auto random_operation(const Value& document, RandomEngine& rng,
                      RandomContext context = RandomContext::root,
                      const RandomOptions& options = {}) -> Operation;

}  // namespace jot_cpp
