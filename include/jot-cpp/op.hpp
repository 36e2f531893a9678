/// @file op.hpp
/// @brief The operation contract and the closed set of operation variants.

#pragma once

#include <jot-cpp/value.hpp>

#include <compare>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace jot_cpp {

struct NoOp;
struct Set;
struct Math;
class Apply;
struct List;
struct Copy;
struct Paste;
struct Clipboard;

/// The closed set of operation variants.
using OpVariant = std::variant<NoOp, Set, Math, Apply, List, Copy, Paste, Clipboard>;

/// An opaque capture reference shared by a Copy and the Pastes that use it.
///
/// Every default-constructed Copy gets a fresh symbol; ids are unique for
/// the lifetime of the process.
struct Symbol {
    std::uint64_t id{0};  ///< Process-unique identifier.

    /// Allocate a new, never-before-seen symbol.
    static auto make() -> Symbol;

    auto operator<=>(const Symbol&) const = default;
    auto operator==(const Symbol&) const -> bool = default;
};

/// Values captured by Copy operations during one top-level apply().
struct PasteBuffer {
    std::map<Symbol, Value> captured;
};

/// Extra information that lets rebase() resolve what would otherwise be a
/// conflict. Passing any RebaseContext requests a conflictless rebase.
struct RebaseContext {
    /// The value both operations were defined against, when known.
    std::optional<Value> document;
};

class Operation;

/// Rewrites one node of an operation tree; nullopt keeps the node.
using Rewriter = std::function<std::optional<Operation>(const Operation&)>;

/// Inspects one node of an operation tree.
using Inspector = std::function<void(const Operation&)>;

/// An immutable, shareable edit.
///
/// Operation is a cheap-to-copy handle over one of the OpVariant
/// alternatives. Copies share the same immutable node, so operations can be
/// passed between threads freely. Every transforming member returns a newly
/// constructed operation.
///
/// @code
/// auto op = Operation{Apply{"title", Set{"Hello"}}};
/// auto doc = op.apply(Value::object());   // {"title": "Hello"}
/// @endcode
class Operation {
public:
    /// Construct the identity operation.
    Operation();

    Operation(NoOp op);
    Operation(Set op);
    Operation(Math op);
    Operation(Apply op);
    Operation(List op);
    Operation(Copy op);
    Operation(Paste op);
    Operation(Clipboard op);

    /// The underlying variant.
    auto variant() const -> const OpVariant&;

    /// Check which alternative this operation holds.
    template <typename T>
    auto is() const -> bool;

    /// Access the alternative, or nullptr if it holds a different one.
    template <typename T>
    auto get_if() const -> const T*;

    /// True for the canonical identity operation.
    auto is_no_op() const -> bool;

    /// The serialization tag of the held alternative (e.g. "objects.APPLY").
    auto tag() const -> std::string_view;

    // -- The operation contract -----------------------------------------------

    /// Apply this operation to a document, returning the edited document.
    /// @throws Exception on a shape mismatch.
    auto apply(const Value& document) const -> Value;

    /// Apply with an explicit paste buffer shared with enclosing operations.
    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;

    /// A canonical, minimal equivalent; NoOp when there is no effect.
    auto simplify() const -> Operation;

    /// An operation that undoes this one.
    /// @param document The value this operation was applied to.
    auto inverse(const Value& document) const -> Operation;

    /// Invert with an explicit paste buffer shared with enclosing operations,
    /// so that a nested sequence can replay Pastes of values captured by its
    /// siblings.
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;

    /// A single operation equivalent to this followed by other, or nullopt
    /// when no atomic operation can express the pair.
    auto compose(const Operation& other) const -> std::optional<Operation>;

    /// Like compose(), but falls back to a two-element List.
    auto then(const Operation& other) const -> Operation;

    /// Transform two concurrent operations against each other.
    ///
    /// Both operations must be defined against the same base value. Returns
    /// (left, right) where `left` applies after `other` and `right` applies
    /// after `this`, and both orders converge. nullopt signals a conflict.
    /// @param conflictless When present, resolve conflicts deterministically,
    ///   using the prior document if one is supplied.
    auto rebase(const Operation& other,
                const std::optional<RebaseContext>& conflictless = std::nullopt) const
        -> std::optional<std::pair<Operation, Operation>>;

    /// Bottom-up rewrite: children first, then the rebuilt node itself is
    /// offered to the rewriter. Every nested operation is offered once.
    auto traverse(const Rewriter& rewriter) const -> Operation;

    /// Read-only traversal in the same order as traverse().
    void visit(const Inspector& inspector) const;

    /// The part of this operation that applies to one property.
    /// @throws Exception if this operation cannot be addressed by `prop`.
    auto drilldown(const Prop& prop) const -> Operation;

    /// Structural equality.
    friend auto operator==(const Operation& a, const Operation& b) -> bool;

private:
    std::shared_ptr<const OpVariant> node_;
};

/// Printable form, e.g. `<objects.APPLY "a":<values.SET 1>>`.
auto to_string(const Operation& op) -> std::string;
auto operator<<(std::ostream& os, const Operation& op) -> std::ostream&;

/// True if any node in the tree is a Copy or a Paste.
auto uses_paste_buffer(const Operation& op) -> bool;

// =============================================================================
// Variants
// =============================================================================

/// The identity operation.
struct NoOp {
    static constexpr std::string_view tag = "values.NO_OP";

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    auto operator==(const NoOp&) const -> bool = default;
};

/// Replace a value. Setting MISSING removes the property; setting over
/// MISSING creates it.
struct Set {
    static constexpr std::string_view tag = "values.SET";

    Value value;  ///< The new value, possibly missing().

    explicit Set(Value v) : value(std::move(v)) {}

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    friend auto operator==(const Set& a, const Set& b) -> bool {
        return values_equal(a.value, b.value);
    }
};

/// The arithmetic operators supported by Math.
enum class MathOperator : std::uint8_t {
    add,   ///< document + operand
    mult,  ///< document * operand
};

/// Convert a MathOperator to its string representation.
constexpr auto to_string_view(MathOperator op) noexcept -> std::string_view {
    switch (op) {
        case MathOperator::add:  return "add";
        case MathOperator::mult: return "mult";
    }
    return "unknown";
}

/// Arithmetic on a numeric value.
struct Math {
    static constexpr std::string_view tag = "values.MATH";

    MathOperator op;  ///< Which arithmetic to perform.
    Value operand;    ///< A JSON number.

    /// @throws Exception (invalid_argument) if operand is not a number.
    Math(MathOperator o, Value operand);

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    friend auto operator==(const Math& a, const Math& b) -> bool {
        return a.op == b.op && values_equal(a.operand, b.operand);
    }
};

/// Apply operations to the properties of an object.
///
/// Holds a mapping from key to sub-operation. The sub-operations conceptually
/// happen at the same time, but a value moved between keys through Copy and
/// Paste must be captured before it is pasted, so the evaluation order of the
/// keys is resolved once, at construction.
///
/// @code
/// auto op = Apply{{{"x", Set{missing()}}, {"y", Math{MathOperator::add, 1}}}};
/// @endcode
class Apply {
public:
    static constexpr std::string_view tag = "objects.APPLY";

    /// Single-property form.
    /// @throws Exception (invalid_argument) if key is empty.
    Apply(std::string key, Operation op);

    /// Multi-property form.
    /// @throws Exception (invalid_argument) if a key is empty.
    /// @throws Exception (circular_dependency) if the copy/paste references
    ///   between properties cannot be ordered.
    explicit Apply(std::map<std::string, Operation> ops);

    /// The sub-operation for each touched key.
    auto ops() const -> const std::map<std::string, Operation>& { return ops_; }

    /// The order in which apply() evaluates the keys.
    auto order() const -> const std::vector<std::string>& { return order_; }

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    /// The sub-operation for a key, or NoOp if the key is untouched.
    /// @throws Exception (invalid_argument) for a sequence index.
    auto drilldown(const Prop& prop) const -> Operation;

    friend auto operator==(const Apply& a, const Apply& b) -> bool {
        return a.ops_ == b.ops_;
    }

private:
    std::map<std::string, Operation> ops_;
    std::vector<std::string> order_;
};

/// A sequence of operations applied one after another.
struct List {
    static constexpr std::string_view tag = "lists.LIST";

    std::vector<Operation> ops;  ///< Applied front to back.

    explicit List(std::vector<Operation> o) : ops{std::move(o)} {}

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    auto operator==(const List&) const -> bool = default;
};

/// Capture the value at this location so a Paste can reuse it.
/// The value itself is left unchanged.
struct Copy {
    static constexpr std::string_view tag = "copy.COPY";

    Symbol symbol;  ///< The capture reference.

    Copy() : symbol{Symbol::make()} {}
    explicit Copy(Symbol s) : symbol{s} {}

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    auto operator==(const Copy&) const -> bool = default;
};

/// Replace the value at this location with a previously captured value.
struct Paste {
    static constexpr std::string_view tag = "copy.PASTE";

    Symbol symbol;  ///< The capture reference to paste.

    explicit Paste(Symbol s) : symbol{s} {}
    explicit Paste(const Copy& copy) : symbol{copy.symbol} {}

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    auto operator==(const Paste&) const -> bool = default;
};

/// Scope the captures made inside an operation to that operation.
struct Clipboard {
    static constexpr std::string_view tag = "copy.CLIPBOARD";

    Operation op;  ///< The scoped operation.

    explicit Clipboard(Operation o) : op{std::move(o)} {}

    auto apply(const Value& document, PasteBuffer& buffer) const -> Value;
    auto simplify() const -> Operation;
    auto inverse(const Value& document, PasteBuffer& buffer) const -> Operation;
    auto compose(const Operation& other) const -> std::optional<Operation>;

    auto operator==(const Clipboard&) const -> bool = default;
};

// -- Operation inline members -------------------------------------------------

inline auto Operation::variant() const -> const OpVariant& {
    return *node_;
}

template <typename T>
auto Operation::is() const -> bool {
    return std::holds_alternative<T>(*node_);
}

template <typename T>
auto Operation::get_if() const -> const T* {
    return std::get_if<T>(node_.get());
}

}  // namespace jot_cpp
