#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include "logger.hpp"

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jot_cpp {

namespace {

using RebaseResult = std::optional<std::pair<Operation, Operation>>;

auto swapped(RebaseResult result) -> RebaseResult {
    if (!result) return std::nullopt;
    return std::pair{std::move(result->second), std::move(result->first)};
}

auto conflict(const Operation& a, const Operation& b) -> RebaseResult {
    detail::logger().debug("rebase conflict: {} vs {}", to_string(a), to_string(b));
    return std::nullopt;
}

// The context one level down: the prior document becomes the prior value of
// `key` (MISSING when the property does not exist).
auto narrow(const std::optional<RebaseContext>& context, const std::string& key)
    -> std::optional<RebaseContext> {
    if (!context || !context->document) return context;
    const auto& document = *context->document;
    auto narrowed = RebaseContext{};
    if (document.is_object()) {
        auto it = document.find(key);
        narrowed.document = it != document.end() ? Value(*it) : missing();
    } else {
        narrowed.document = missing();
    }
    return narrowed;
}

// -- Captured values ----------------------------------------------------------

using Path = std::vector<std::string>;

void collect_copy_paths(const Operation& op, Path& prefix, std::vector<Path>& paths) {
    std::visit(overload{
        [&](const Apply& a) {
            for (const auto& [key, sub] : a.ops()) {
                prefix.push_back(key);
                collect_copy_paths(sub, prefix, paths);
                prefix.pop_back();
            }
        },
        [&](const List& l) {
            for (const auto& sub : l.ops) collect_copy_paths(sub, prefix, paths);
        },
        [&](const Clipboard& c) { collect_copy_paths(c.op, prefix, paths); },
        [&](const Copy&) { paths.push_back(prefix); },
        [](const auto&) {},
    }, op.variant());
}

// The locations, relative to the root of `op`, whose values a Copy captures.
auto copy_paths(const Operation& op) -> std::vector<Path> {
    auto prefix = Path{};
    auto paths = std::vector<Path>{};
    collect_copy_paths(op, prefix, paths);
    return paths;
}

// Whether `op` may change the value at `path` or anything below it. Every
// element of a sequence is checked against the same path.
auto touches(const Operation& op, const Path& path, std::size_t depth) -> bool {
    return std::visit(overload{
        [](const NoOp&) { return false; },
        [](const Copy&) { return false; },
        [&](const Apply& a) {
            if (depth == path.size()) {
                return std::ranges::any_of(a.ops(), [&](const auto& entry) {
                    return touches(entry.second, path, depth);
                });
            }
            auto it = a.ops().find(path[depth]);
            return it != a.ops().end() && touches(it->second, path, depth + 1);
        },
        [&](const List& l) {
            return std::ranges::any_of(l.ops, [&](const Operation& sub) {
                return touches(sub, path, depth);
            });
        },
        [&](const Clipboard& c) { return touches(c.op, path, depth); },
        [](const auto&) { return true; },
    }, op.variant());
}

// True if `other` edits a value that `op` captures. The capture would then
// paste a different value on each side.
auto captures_edited_value(const Operation& op, const Operation& other) -> bool {
    return std::ranges::any_of(copy_paths(op), [&](const Path& path) {
        return touches(other, path, 0);
    });
}

// The same edit of `document` without the paste buffer: every Paste becomes
// a Set of the value it pastes and every Copy is dropped.
auto materialize(const Operation& op, const Value& document) -> Operation {
    const auto unscoped = op.traverse([](const Operation& node) -> std::optional<Operation> {
        if (const auto* clipboard = node.get_if<Clipboard>()) return clipboard->op;
        return std::nullopt;
    });
    auto buffer = PasteBuffer{};
    unscoped.apply(document, buffer);
    return unscoped.traverse([&](const Operation& node) -> std::optional<Operation> {
        if (node.is<Copy>()) return Operation{};
        if (const auto* paste = node.get_if<Paste>()) {
            return Operation{Set{buffer.captured.at(paste->symbol)}};
        }
        return std::nullopt;
    }).simplify();
}

// Variants that Operation::rebase() handles before pair dispatch.
template <typename T>
concept Structural = std::same_as<T, NoOp> || std::same_as<T, List> ||
                     std::same_as<T, Copy> || std::same_as<T, Clipboard>;

// Rebase of two atomic operations. There is one overload per ordered pair of
// {Set, Math, Apply, Paste}; std::visit fails to compile if one is missing.
// Each handler returns (self rebased after other, other rebased after self).
class AtomicRebase {
public:
    AtomicRebase(const Operation& self, const Operation& other,
                 const std::optional<RebaseContext>& context)
        : self_{self}, other_{other}, context_{context} {}

    // -- Set ------------------------------------------------------------------

    auto operator()(const Set& a, const Set& b) const -> RebaseResult {
        if (values_equal(a.value, b.value)) return both_no_op();
        if (!context_) return conflict(self_, other_);
        // The greater value wins regardless of which side rebases.
        return value_less(b.value, a.value) ? self_wins() : other_wins();
    }

    auto operator()(const Set&, const Math&) const -> RebaseResult { return set_wins(); }
    auto operator()(const Set&, const Apply&) const -> RebaseResult { return set_wins(); }
    auto operator()(const Set&, const Paste&) const -> RebaseResult { return set_wins(); }

    // -- Math -----------------------------------------------------------------

    auto operator()(const Math& a, const Set& b) const -> RebaseResult { return mirror(a, b); }

    auto operator()(const Math& a, const Math& b) const -> RebaseResult {
        // Same-operator arithmetic commutes.
        if (a.op == b.op) return std::pair{self_, other_};
        if (!context_ || !context_->document || !context_->document->is_number()) {
            return conflict(self_, other_);
        }
        // Different operators do not commute. Both sides converge on the
        // result of applying the two in operator order to the prior value.
        const auto& prior = *context_->document;
        const auto result = a.op < b.op ? other_.apply(self_.apply(prior))
                                        : self_.apply(other_.apply(prior));
        return std::pair{Operation{Set{result}}, Operation{Set{result}}};
    }

    auto operator()(const Math&, const Apply&) const -> RebaseResult {
        return conflict(self_, other_);
    }

    auto operator()(const Math&, const Paste&) const -> RebaseResult { return paste_wins(); }

    // -- Apply ----------------------------------------------------------------

    auto operator()(const Apply& a, const Set& b) const -> RebaseResult { return mirror(a, b); }
    auto operator()(const Apply& a, const Math& b) const -> RebaseResult { return mirror(a, b); }

    auto operator()(const Apply& a, const Apply& b) const -> RebaseResult {
        // Keys touched by one side only never conflict. Keys touched by both
        // are rebased recursively against the prior value of that key.
        auto left = std::map<std::string, Operation>{};
        auto right = std::map<std::string, Operation>{};
        for (const auto& [key, op] : a.ops()) {
            auto it = b.ops().find(key);
            if (it == b.ops().end()) {
                left.emplace(key, op);
                continue;
            }
            auto rebased = op.rebase(it->second, narrow(context_, key));
            if (!rebased) return std::nullopt;
            left.emplace(key, std::move(rebased->first));
            right.emplace(key, std::move(rebased->second));
        }
        for (const auto& [key, op] : b.ops()) {
            if (!a.ops().contains(key)) right.emplace(key, op);
        }
        return std::pair{Apply{std::move(left)}.simplify(), Apply{std::move(right)}.simplify()};
    }

    auto operator()(const Apply&, const Paste&) const -> RebaseResult { return paste_wins(); }

    // -- Paste ----------------------------------------------------------------

    auto operator()(const Paste& a, const Set& b) const -> RebaseResult { return mirror(a, b); }
    auto operator()(const Paste& a, const Math& b) const -> RebaseResult { return mirror(a, b); }
    auto operator()(const Paste& a, const Apply& b) const -> RebaseResult { return mirror(a, b); }

    auto operator()(const Paste& a, const Paste& b) const -> RebaseResult {
        if (a.symbol == b.symbol) return both_no_op();
        if (!context_) return conflict(self_, other_);
        return b.symbol < a.symbol ? self_wins() : other_wins();
    }

    // -- Structural variants --------------------------------------------------

    template <typename A, typename B>
        requires (Structural<A> || Structural<B>)
    auto operator()(const A&, const B&) const -> RebaseResult {
        throw Exception{ErrorKind::invalid_operation,
                        "no atomic rebase between " + std::string{A::tag} + " and " +
                            std::string{B::tag}};
    }

private:
    template <typename A, typename B>
    auto mirror(const A& a, const B& b) const -> RebaseResult {
        return swapped(AtomicRebase{other_, self_, context_}(b, a));
    }

    auto both_no_op() const -> RebaseResult {
        return std::pair{Operation{}, Operation{}};
    }

    auto self_wins() const -> RebaseResult {
        return std::pair{self_, Operation{}};
    }

    auto other_wins() const -> RebaseResult {
        return std::pair{Operation{}, other_};
    }

    // A Set replaces whatever the other side did, when resolving conflicts.
    auto set_wins() const -> RebaseResult {
        if (!context_) return conflict(self_, other_);
        return self_wins();
    }

    // A Paste replaces a Math or an Apply, when resolving conflicts.
    auto paste_wins() const -> RebaseResult {
        if (!context_) return conflict(self_, other_);
        return other_wins();
    }

    const Operation& self_;
    const Operation& other_;
    const std::optional<RebaseContext>& context_;
};

// Rebase each element of a sequence in turn, carrying the rebased `other`
// forward and advancing the prior document past each element.
auto rebase_sequence(const List& list, const Operation& other,
                     const std::optional<RebaseContext>& context) -> RebaseResult {
    auto step_context = context;
    auto current = other;
    auto rebased = std::vector<Operation>{};
    rebased.reserve(list.ops.size());
    for (const auto& op : list.ops) {
        auto result = op.rebase(current, step_context);
        if (!result) return std::nullopt;
        rebased.push_back(std::move(result->first));
        current = std::move(result->second);
        if (step_context && step_context->document) {
            step_context->document = op.apply(*step_context->document);
        }
    }
    return std::pair{Operation{List{std::move(rebased)}}, std::move(current)};
}

}  // anonymous namespace

auto Operation::rebase(const Operation& other,
                       const std::optional<RebaseContext>& conflictless) const
    -> std::optional<std::pair<Operation, Operation>> {
    if (is_no_op() || other.is_no_op()) {
        return std::pair{*this, other};
    }

    if (uses_paste_buffer(*this) || uses_paste_buffer(other)) {
        if (conflictless && conflictless->document) {
            // With the prior document every pasted value is known.
            const auto& document = *conflictless->document;
            return materialize(*this, document).rebase(materialize(other, document),
                                                       conflictless);
        }
        if (captures_edited_value(*this, other) || captures_edited_value(other, *this)) {
            return conflict(*this, other);
        }
    }

    if (const auto* list = get_if<List>()) {
        return rebase_sequence(*list, other, conflictless);
    }
    if (other.is<List>()) {
        return swapped(other.rebase(*this, conflictless));
    }

    if (const auto* clipboard = get_if<Clipboard>()) {
        auto rebased = clipboard->op.rebase(other, conflictless);
        if (!rebased) return std::nullopt;
        return std::pair{Operation{Clipboard{std::move(rebased->first)}},
                         std::move(rebased->second)};
    }
    if (other.is<Clipboard>()) {
        return swapped(other.rebase(*this, conflictless));
    }

    // The other side leaves the copied value alone, and Copy does not change
    // it either.
    if (is<Copy>() || other.is<Copy>()) {
        return std::pair{*this, other};
    }

    return std::visit(AtomicRebase{*this, other, conflictless}, *node_, *other.node_);
}

}  // namespace jot_cpp
