#include <jot-cpp/value.hpp>

#include <string>

namespace jot_cpp {

auto missing() -> const Value& {
    static const auto sentinel = Value(Value::value_t::discarded);
    return sentinel;
}

auto values_equal(const Value& a, const Value& b) -> bool {
    if (is_missing(a) || is_missing(b)) {
        return is_missing(a) && is_missing(b);
    }
    return a == b;
}

auto value_less(const Value& a, const Value& b) -> bool {
    if (is_missing(a)) return !is_missing(b);
    if (is_missing(b)) return false;
    // nlohmann orders values of different types by type first, and treats
    // 1 and 1.0 as equal, so fall back to the serialized form to break ties
    // that operator< leaves open.
    if (a < b) return true;
    if (b < a) return false;
    return a.dump() < b.dump();
}

auto to_string(const Value& v) -> std::string {
    if (is_missing(v)) return "MISSING";
    return v.dump();
}

}  // namespace jot_cpp
