#include <jot-cpp/op.hpp>

#include <algorithm>
#include <utility>
#include <vector>

namespace jot_cpp {

auto List::apply(const Value& document, PasteBuffer& buffer) const -> Value {
    auto result = document;
    for (const auto& op : ops) {
        result = op.apply(result, buffer);
    }
    return result;
}

auto List::simplify() const -> Operation {
    // Simplify each element, drop identities, and fold neighbours that
    // compose atomically until no adjacent pair does.
    // Nested lists are spliced into this one.
    auto stack = std::vector<Operation>{};
    stack.reserve(ops.size());
    auto push = [&stack](Operation op) {
        while (!op.is_no_op() && !stack.empty() && !op.is<List>()) {
            auto composed = stack.back().compose(op);
            if (!composed) break;
            stack.pop_back();
            op = composed->simplify();
        }
        if (!op.is_no_op()) {
            stack.push_back(std::move(op));
        }
    };
    for (const auto& element : ops) {
        auto op = element.simplify();
        if (const auto* nested = op.get_if<List>()) {
            for (const auto& inner : nested->ops) push(inner);
        } else {
            push(std::move(op));
        }
    }

    if (stack.empty()) return NoOp{};
    if (stack.size() == 1) return stack.front();
    return List{std::move(stack)};
}

auto List::inverse(const Value& document, PasteBuffer& buffer) const -> Operation {
    // Each element is inverted against the document as it was just before
    // that element ran. Replaying the elements needs the captures made so far,
    // including those of sibling properties evaluated earlier.
    auto current = document;
    auto inverses = std::vector<Operation>{};
    inverses.reserve(ops.size());
    for (const auto& op : ops) {
        inverses.push_back(op.inverse(current, buffer));
        current = op.apply(current, buffer);
    }
    std::ranges::reverse(inverses);
    return List{std::move(inverses)};
}

auto List::compose(const Operation& other) const -> std::optional<Operation> {
    auto combined = ops;
    if (const auto* next = other.get_if<List>()) {
        combined.insert(combined.end(), next->ops.begin(), next->ops.end());
    } else {
        combined.push_back(other);
    }
    return List{std::move(combined)};
}

}  // namespace jot_cpp
