#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include <atomic>
#include <map>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace jot_cpp {

auto Symbol::make() -> Symbol {
    static auto next = std::atomic<std::uint64_t>{1};
    return Symbol{next.fetch_add(1, std::memory_order_relaxed)};
}

// -- Construction -------------------------------------------------------------

Operation::Operation() : Operation{NoOp{}} {}

Operation::Operation(NoOp op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Set op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Math op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Apply op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(List op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Copy op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Paste op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}
Operation::Operation(Clipboard op)
    : node_{std::make_shared<const OpVariant>(std::move(op))} {}

auto Operation::is_no_op() const -> bool {
    return is<NoOp>();
}

auto Operation::tag() const -> std::string_view {
    return std::visit([](const auto& op) { return op.tag; }, *node_);
}

// -- Contract dispatch --------------------------------------------------------

auto Operation::apply(const Value& document) const -> Value {
    auto buffer = PasteBuffer{};
    return apply(document, buffer);
}

auto Operation::apply(const Value& document, PasteBuffer& buffer) const -> Value {
    return std::visit([&](const auto& op) { return op.apply(document, buffer); }, *node_);
}

auto Operation::simplify() const -> Operation {
    return std::visit([](const auto& op) { return op.simplify(); }, *node_);
}

auto Operation::inverse(const Value& document) const -> Operation {
    auto buffer = PasteBuffer{};
    return inverse(document, buffer);
}

auto Operation::inverse(const Value& document, PasteBuffer& buffer) const -> Operation {
    return std::visit([&](const auto& op) { return op.inverse(document, buffer); }, *node_);
}

auto Operation::compose(const Operation& other) const -> std::optional<Operation> {
    if (is_no_op()) return other;
    if (other.is_no_op()) return *this;
    return std::visit([&](const auto& op) { return op.compose(other); }, *node_);
}

auto Operation::then(const Operation& other) const -> Operation {
    if (auto composed = compose(other)) {
        return *composed;
    }
    return List{{*this, other}};
}

// -- Traversal ----------------------------------------------------------------

auto Operation::traverse(const Rewriter& rewriter) const -> Operation {
    auto rebuilt = std::visit(overload{
        [&](const Apply& op) -> Operation {
            auto ops = std::map<std::string, Operation>{};
            for (const auto& [key, sub] : op.ops()) {
                ops.emplace(key, sub.traverse(rewriter));
            }
            return Apply{std::move(ops)};
        },
        [&](const List& op) -> Operation {
            auto ops = std::vector<Operation>{};
            ops.reserve(op.ops.size());
            for (const auto& sub : op.ops) {
                ops.push_back(sub.traverse(rewriter));
            }
            return List{std::move(ops)};
        },
        [&](const Clipboard& op) -> Operation {
            return Clipboard{op.op.traverse(rewriter)};
        },
        [&](const auto&) -> Operation { return *this; },
    }, *node_);

    if (auto replacement = rewriter(rebuilt)) {
        return *replacement;
    }
    return rebuilt;
}

void Operation::visit(const Inspector& inspector) const {
    std::visit(overload{
        [&](const Apply& op) {
            for (const auto& [key, sub] : op.ops()) sub.visit(inspector);
        },
        [&](const List& op) {
            for (const auto& sub : op.ops) sub.visit(inspector);
        },
        [&](const Clipboard& op) { op.op.visit(inspector); },
        [](const auto&) {},
    }, *node_);
    inspector(*this);
}

auto Operation::drilldown(const Prop& prop) const -> Operation {
    return std::visit(overload{
        [&](const Apply& op) { return op.drilldown(prop); },
        [](const NoOp&) { return Operation{}; },
        [&](const auto&) -> Operation {
            throw Exception{ErrorKind::invalid_operation,
                            "cannot drill down into " + std::string{tag()}};
        },
    }, *node_);
}

auto operator==(const Operation& a, const Operation& b) -> bool {
    if (a.node_ == b.node_) return true;
    return *a.node_ == *b.node_;
}

auto uses_paste_buffer(const Operation& op) -> bool {
    auto found = false;
    op.visit([&](const Operation& node) {
        if (node.is<Copy>() || node.is<Paste>()) found = true;
    });
    return found;
}

// -- Printing -----------------------------------------------------------------

auto to_string(const Operation& op) -> std::string {
    return std::visit(overload{
        [](const NoOp&) -> std::string { return "<values.NO_OP>"; },
        [](const Set& s) -> std::string {
            return "<values.SET " + to_string(s.value) + ">";
        },
        [](const Math& m) -> std::string {
            return "<values.MATH " + std::string{to_string_view(m.op)} + ":" +
                   to_string(m.operand) + ">";
        },
        [](const Apply& a) -> std::string {
            auto out = std::string{"<objects.APPLY "};
            auto first = true;
            for (const auto& [key, sub] : a.ops()) {
                if (!first) out += ", ";
                first = false;
                out += Value(key).dump() + ":" + to_string(sub);
            }
            return out + ">";
        },
        [](const List& l) -> std::string {
            auto out = std::string{"<lists.LIST ["};
            for (std::size_t i = 0; i < l.ops.size(); ++i) {
                if (i != 0) out += ", ";
                out += to_string(l.ops[i]);
            }
            return out + "]>";
        },
        [](const Copy& c) -> std::string {
            return "<copy.COPY #" + std::to_string(c.symbol.id) + ">";
        },
        [](const Paste& p) -> std::string {
            return "<copy.PASTE #" + std::to_string(p.symbol.id) + ">";
        },
        [](const Clipboard& c) -> std::string {
            return "<copy.CLIPBOARD " + to_string(c.op) + ">";
        },
    }, op.variant());
}

auto operator<<(std::ostream& os, const Operation& op) -> std::ostream& {
    return os << to_string(op);
}

}  // namespace jot_cpp
