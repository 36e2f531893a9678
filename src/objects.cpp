#include <jot-cpp/error.hpp>
#include <jot-cpp/objects.hpp>
#include <jot-cpp/op.hpp>

#include "dependency_resolver.hpp"
#include "logger.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace jot_cpp {

namespace {

auto validated(std::map<std::string, Operation> ops) -> std::map<std::string, Operation> {
    for (const auto& [key, op] : ops) {
        if (key.empty()) {
            throw Exception{ErrorKind::invalid_argument, "APPLY keys must be non-empty strings"};
        }
    }
    return ops;
}

void require_object(const Value& document, std::string_view what) {
    if (!document.is_object()) {
        throw Exception{ErrorKind::type_mismatch,
                        std::string{"APPLY "} + std::string{what} +
                            " requires an object, got " + to_string(document)};
    }
}

// The value at `key`, or MISSING when the property does not exist.
auto property(const Value& document, const std::string& key) -> Value {
    auto it = document.find(key);
    return it != document.end() ? *it : missing();
}

}  // anonymous namespace

// =============================================================================
// Apply
// =============================================================================

Apply::Apply(std::string key, Operation op)
    : Apply{std::map<std::string, Operation>{{std::move(key), std::move(op)}}} {}

Apply::Apply(std::map<std::string, Operation> ops)
    : ops_{validated(std::move(ops))},
      order_{detail::resolve_evaluation_order(ops_)} {}

auto Apply::apply(const Value& document, PasteBuffer& buffer) const -> Value {
    require_object(document, "apply");
    auto result = document;
    for (const auto& key : order_) {
        auto value = ops_.at(key).apply(property(result, key), buffer);
        if (is_missing(value)) {
            result.erase(key);
        } else {
            result[key] = std::move(value);
        }
    }
    return result;
}

auto Apply::simplify() const -> Operation {
    auto simplified = std::map<std::string, Operation>{};
    for (const auto& [key, op] : ops_) {
        auto sub = op.simplify();
        if (!sub.is_no_op()) {
            simplified.emplace(key, std::move(sub));
        }
    }
    if (simplified.empty()) return NoOp{};
    return Apply{std::move(simplified)};
}

auto Apply::inverse(const Value& document, PasteBuffer& buffer) const -> Operation {
    require_object(document, "inverse");
    // Keys are inverted in evaluation order so that a Paste below one key sees
    // the values captured by the Copies it depends on.
    auto inverted = std::map<std::string, Operation>{};
    for (const auto& key : order_) {
        inverted.emplace(key, ops_.at(key).inverse(property(document, key), buffer));
    }
    return Apply{std::move(inverted)};
}

auto Apply::compose(const Operation& other) const -> std::optional<Operation> {
    if (other.is<Set>() && !uses_paste_buffer(Operation{*this})) {
        return other;
    }
    const auto* next = other.get_if<Apply>();
    if (!next) return std::nullopt;

    // Keys touched by only one side happen in parallel and pass through.
    auto combined = ops_;
    for (const auto& [key, op] : next->ops_) {
        auto it = combined.find(key);
        if (it == combined.end()) {
            combined.emplace(key, op);
            continue;
        }
        auto composed = it->second.then(op);
        if (composed.is_no_op()) {
            combined.erase(it);
        } else {
            it->second = std::move(composed);
        }
    }

    try {
        return Apply{std::move(combined)}.simplify();
    } catch (const Exception& e) {
        if (e.kind() != ErrorKind::circular_dependency) throw;
        // The copies and pastes of the two operations cannot share one
        // evaluation order; the pair has to stay a sequence.
        detail::logger().debug("APPLY compose not representable: {}", e.what());
        return std::nullopt;
    }
}

auto Apply::drilldown(const Prop& prop) const -> Operation {
    const auto* key = std::get_if<std::string>(&prop);
    if (!key) {
        throw Exception{ErrorKind::invalid_argument,
                        "cannot drill down into APPLY with index " +
                            std::to_string(std::get<std::size_t>(prop))};
    }
    auto it = ops_.find(*key);
    return it != ops_.end() ? it->second : Operation{};
}

// =============================================================================
// Convenience operations
// =============================================================================

auto put(std::string key, Value value) -> Operation {
    return Apply{std::move(key), Set{std::move(value)}};
}

auto remove(std::string key) -> Operation {
    return Apply{std::move(key), Set{missing()}};
}

auto rename(std::string old_key, std::string new_key) -> Operation {
    if (old_key == new_key) {
        throw Exception{ErrorKind::invalid_argument,
                        "cannot rename property " + Value(old_key).dump() + " to itself"};
    }
    auto copy = Copy{};
    auto paste = Paste{copy};
    return Clipboard{List{{
        Apply{old_key, copy},
        remove(old_key),
        Apply{std::move(new_key), paste},
    }}};
}

}  // namespace jot_cpp
