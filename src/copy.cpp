#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include <string>
#include <utility>
#include <vector>

namespace jot_cpp {

// =============================================================================
// Copy
// =============================================================================

auto Copy::apply(const Value& document, PasteBuffer& buffer) const -> Value {
    buffer.captured.insert_or_assign(symbol, document);
    return document;
}

auto Copy::simplify() const -> Operation {
    return *this;
}

auto Copy::inverse(const Value& document, PasteBuffer& buffer) const -> Operation {
    buffer.captured.insert_or_assign(symbol, document);
    return NoOp{};
}

auto Copy::compose(const Operation&) const -> std::optional<Operation> {
    return std::nullopt;
}

// =============================================================================
// Paste
// =============================================================================

auto Paste::apply(const Value&, PasteBuffer& buffer) const -> Value {
    auto it = buffer.captured.find(symbol);
    if (it == buffer.captured.end()) {
        throw Exception{ErrorKind::invalid_operation,
                        "PASTE #" + std::to_string(symbol.id) +
                            " has no value: its COPY has not been applied"};
    }
    return it->second;
}

auto Paste::simplify() const -> Operation {
    return *this;
}

auto Paste::inverse(const Value& document, PasteBuffer&) const -> Operation {
    return Set{document};
}

auto Paste::compose(const Operation& other) const -> std::optional<Operation> {
    if (other.is<Set>()) return other;
    return std::nullopt;
}

// =============================================================================
// Clipboard
// =============================================================================

namespace {

auto captured_symbols(const Operation& op) -> std::vector<Symbol> {
    auto symbols = std::vector<Symbol>{};
    op.visit([&](const Operation& node) {
        if (const auto* copy = node.get_if<Copy>()) symbols.push_back(copy->symbol);
    });
    return symbols;
}

}  // anonymous namespace

auto Clipboard::apply(const Value& document, PasteBuffer& buffer) const -> Value {
    auto result = op.apply(document, buffer);
    for (const auto& symbol : captured_symbols(op)) {
        buffer.captured.erase(symbol);
    }
    return result;
}

auto Clipboard::simplify() const -> Operation {
    auto inner = op.simplify();
    if (inner.is_no_op() || !uses_paste_buffer(inner)) {
        return inner;
    }
    return Clipboard{std::move(inner)};
}

auto Clipboard::inverse(const Value& document, PasteBuffer& buffer) const -> Operation {
    auto inverse = op.inverse(document, buffer);
    for (const auto& symbol : captured_symbols(op)) {
        buffer.captured.erase(symbol);
    }
    return Clipboard{std::move(inverse)};
}

auto Clipboard::compose(const Operation&) const -> std::optional<Operation> {
    return std::nullopt;
}

}  // namespace jot_cpp
