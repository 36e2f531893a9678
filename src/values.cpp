#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>

namespace jot_cpp {

namespace {

constexpr auto int_min = std::numeric_limits<std::int64_t>::min();
constexpr auto int_max = std::numeric_limits<std::int64_t>::max();

auto as_double(const Value& v) -> double {
    return v.get<double>();
}

// The value as a signed 64-bit integer, or nullopt for floats and for
// unsigned integers above INT64_MAX.
auto as_int(const Value& v) -> std::optional<std::int64_t> {
    if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(int_max)) return std::nullopt;
        return static_cast<std::int64_t>(u);
    }
    if (v.is_number_integer()) return v.get<std::int64_t>();
    return std::nullopt;
}

auto checked_add(std::int64_t a, std::int64_t b) -> std::optional<std::int64_t> {
    if (b > 0 ? a > int_max - b : a < int_min - b) return std::nullopt;
    return a + b;
}

auto checked_multiply(std::int64_t a, std::int64_t b) -> std::optional<std::int64_t> {
    if (a > 0) {
        if (b > 0 ? a > int_max / b : b < int_min / a) return std::nullopt;
    } else if (b > 0) {
        if (a < int_min / b) return std::nullopt;
    } else if (a != 0 && b < int_max / a) {
        return std::nullopt;
    }
    return a * b;
}

auto is_zero(const Value& v) -> bool {
    return as_double(v) == 0.0;
}

auto is_one(const Value& v) -> bool {
    return as_double(v) == 1.0;
}

// Integers stay integers when both sides are integral and the result fits in
// 64 bits; otherwise the arithmetic is done in double precision.
auto add(const Value& a, const Value& b) -> Value {
    const auto x = as_int(a);
    const auto y = as_int(b);
    if (x && y) {
        if (auto sum = checked_add(*x, *y)) return *sum;
    }
    return as_double(a) + as_double(b);
}

auto multiply(const Value& a, const Value& b) -> Value {
    const auto x = as_int(a);
    const auto y = as_int(b);
    if (x && y) {
        if (auto product = checked_multiply(*x, *y)) return *product;
    }
    return as_double(a) * as_double(b);
}

auto negate(const Value& v) -> Value {
    if (const auto x = as_int(v); x && *x != int_min) return -*x;
    return -as_double(v);
}

}  // anonymous namespace

// =============================================================================
// NoOp
// =============================================================================

auto NoOp::apply(const Value& document, PasteBuffer&) const -> Value {
    return document;
}

auto NoOp::simplify() const -> Operation {
    return *this;
}

auto NoOp::inverse(const Value&, PasteBuffer&) const -> Operation {
    return *this;
}

auto NoOp::compose(const Operation& other) const -> std::optional<Operation> {
    return other;
}

// =============================================================================
// Set
// =============================================================================

auto Set::apply(const Value&, PasteBuffer&) const -> Value {
    return value;
}

auto Set::simplify() const -> Operation {
    return *this;
}

auto Set::inverse(const Value& document, PasteBuffer&) const -> Operation {
    return Set{document};
}

auto Set::compose(const Operation& other) const -> std::optional<Operation> {
    if (const auto* next = other.get_if<Set>()) {
        return *next;
    }
    // Whatever follows a Set can be folded into the assigned value, unless it
    // has an effect on the paste buffer that the fold would lose.
    if (uses_paste_buffer(other)) {
        return std::nullopt;
    }
    return Set{other.apply(value)};
}

// =============================================================================
// Math
// =============================================================================

Math::Math(MathOperator o, Value operand)
    : op{o}, operand(std::move(operand)) {
    if (!this->operand.is_number()) {
        throw Exception{ErrorKind::invalid_argument,
                        "MATH operand must be a number, got " + to_string(this->operand)};
    }
}

auto Math::apply(const Value& document, PasteBuffer&) const -> Value {
    if (!document.is_number()) {
        throw Exception{ErrorKind::type_mismatch,
                        "MATH " + std::string{to_string_view(op)} +
                            " cannot be applied to " + to_string(document)};
    }
    switch (op) {
        case MathOperator::add:  return add(document, operand);
        case MathOperator::mult: return multiply(document, operand);
    }
    return document;
}

auto Math::simplify() const -> Operation {
    if (op == MathOperator::add && is_zero(operand)) return NoOp{};
    if (op == MathOperator::mult && is_one(operand)) return NoOp{};
    return *this;
}

auto Math::inverse(const Value& document, PasteBuffer&) const -> Operation {
    if (op == MathOperator::add) {
        // An integer sum that left the 64-bit range was computed as a double
        // and cannot be undone exactly.
        const auto overflowed = document.is_number_integer() && as_int(document) &&
                                as_int(operand) && !add(document, operand).is_number_integer();
        if (!overflowed) return Math{MathOperator::add, negate(operand)};
    }
    // Multiplication by zero loses information too; restore the prior value.
    return Set{document};
}

auto Math::compose(const Operation& other) const -> std::optional<Operation> {
    if (const auto* next = other.get_if<Math>()) {
        if (next->op != op) return std::nullopt;
        switch (op) {
            case MathOperator::add:  return Math{op, add(operand, next->operand)};
            case MathOperator::mult: return Math{op, multiply(operand, next->operand)};
        }
    }
    if (other.is<Set>()) {
        return other;
    }
    return std::nullopt;
}

}  // namespace jot_cpp
