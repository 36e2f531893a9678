/// @file error.hpp
/// @brief Error types for the jot-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace jot_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_argument,     ///< An operation was constructed or addressed with bad arguments.
    circular_dependency,  ///< Copy/paste references between keys form a cycle.
    type_mismatch,        ///< An operation was applied to a value of the wrong shape.
    invalid_operation,    ///< An operation is invalid in the current context.
    encoding_error,       ///< An operation could not be serialized.
    decoding_error,       ///< A serialized operation could not be parsed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_argument:    return "invalid_argument";
        case ErrorKind::circular_dependency: return "circular_dependency";
        case ErrorKind::type_mismatch:       return "type_mismatch";
        case ErrorKind::invalid_operation:   return "invalid_operation";
        case ErrorKind::encoding_error:      return "encoding_error";
        case ErrorKind::decoding_error:      return "decoding_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown for structural failures (bad constructor arguments,
/// circular copy/paste dependencies, shape mismatches, malformed input).
///
/// Expected outcomes such as rebase conflicts or non-representable
/// compositions are reported through std::optional instead.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    /// The category of this failure.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

    /// The full structured error.
    auto error() const noexcept -> const Error& { return error_; }

private:
    Error error_;
};

}  // namespace jot_cpp
