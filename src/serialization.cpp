#include <jot-cpp/error.hpp>
#include <jot-cpp/serialization.hpp>

#include "logger.hpp"

#include <string>
#include <utility>

namespace jot_cpp {

namespace {

[[noreturn]] void malformed(std::string_view tag, std::string_view problem) {
    throw Exception{ErrorKind::decoding_error,
                    std::string{tag} + ": " + std::string{problem}};
}

auto field(const nlohmann::json& node, std::string_view tag, const char* name)
    -> const nlohmann::json& {
    auto it = node.find(name);
    if (it == node.end()) malformed(tag, std::string{"missing field '"} + name + "'");
    return *it;
}

auto symbol_id(const nlohmann::json& node, std::string_view tag) -> std::uint64_t {
    const auto& id = field(node, tag, "symbol");
    if (!id.is_number_unsigned()) malformed(tag, "'symbol' must be a non-negative integer");
    return id.get<std::uint64_t>();
}

auto math_operator_from(std::string_view name) -> std::optional<MathOperator> {
    if (name == to_string_view(MathOperator::add)) return MathOperator::add;
    if (name == to_string_view(MathOperator::mult)) return MathOperator::mult;
    return std::nullopt;
}

// -- Parsers ------------------------------------------------------------------

auto parse_no_op(const nlohmann::json&, DecodeContext&) -> Operation {
    return NoOp{};
}

auto parse_set(const nlohmann::json& node, DecodeContext&) -> Operation {
    if (node.value("missing", false)) return Set{missing()};
    return Set{field(node, Set::tag, "value")};
}

auto parse_math(const nlohmann::json& node, DecodeContext&) -> Operation {
    const auto& name = field(node, Math::tag, "operator");
    if (!name.is_string()) malformed(Math::tag, "'operator' must be a string");
    auto op = math_operator_from(name.get<std::string>());
    if (!op) malformed(Math::tag, "unknown operator " + name.dump());
    const auto& operand = field(node, Math::tag, "operand");
    if (!operand.is_number()) malformed(Math::tag, "'operand' must be a number");
    return Math{*op, operand};
}

auto parse_apply(const nlohmann::json& node, DecodeContext& context) -> Operation {
    const auto& ops = field(node, Apply::tag, "ops");
    if (!ops.is_object()) malformed(Apply::tag, "'ops' must be an object");
    auto parsed = std::map<std::string, Operation>{};
    for (const auto& [key, sub] : ops.items()) {
        parsed.emplace(key, context.decode(sub));
    }
    return Apply{std::move(parsed)};
}

auto parse_list(const nlohmann::json& node, DecodeContext& context) -> Operation {
    const auto& ops = field(node, List::tag, "ops");
    if (!ops.is_array()) malformed(List::tag, "'ops' must be an array");
    auto parsed = std::vector<Operation>{};
    parsed.reserve(ops.size());
    for (const auto& sub : ops) {
        parsed.push_back(context.decode(sub));
    }
    return List{std::move(parsed)};
}

auto parse_copy(const nlohmann::json& node, DecodeContext& context) -> Operation {
    return Copy{context.symbol(symbol_id(node, Copy::tag))};
}

auto parse_paste(const nlohmann::json& node, DecodeContext& context) -> Operation {
    return Paste{context.symbol(symbol_id(node, Paste::tag))};
}

auto parse_clipboard(const nlohmann::json& node, DecodeContext& context) -> Operation {
    return Clipboard{context.decode(field(node, Clipboard::tag, "op"))};
}

// -- Encoder ------------------------------------------------------------------

auto encode(const Operation& op, const OperationRegistry& registry) -> nlohmann::json {
    if (!registry.contains(op.tag())) {
        throw Exception{ErrorKind::encoding_error,
                        "operation tag '" + std::string{op.tag()} + "' is not registered"};
    }
    auto node = nlohmann::json::object();
    node[std::string{type_key}] = std::string{op.tag()};
    std::visit(overload{
        [](const NoOp&) {},
        [&](const Set& s) {
            if (is_missing(s.value)) {
                node["missing"] = true;
            } else {
                node["value"] = s.value;
            }
        },
        [&](const Math& m) {
            node["operator"] = std::string{to_string_view(m.op)};
            node["operand"] = m.operand;
        },
        [&](const Apply& a) {
            auto ops = nlohmann::json::object();
            for (const auto& [key, sub] : a.ops()) {
                ops[key] = encode(sub, registry);
            }
            node["ops"] = std::move(ops);
        },
        [&](const List& l) {
            auto ops = nlohmann::json::array();
            for (const auto& sub : l.ops) {
                ops.push_back(encode(sub, registry));
            }
            node["ops"] = std::move(ops);
        },
        [&](const Copy& c) { node["symbol"] = c.symbol.id; },
        [&](const Paste& p) { node["symbol"] = p.symbol.id; },
        [&](const Clipboard& c) { node["op"] = encode(c.op, registry); },
    }, op.variant());
    return node;
}

}  // anonymous namespace

// =============================================================================
// DecodeContext
// =============================================================================

auto DecodeContext::decode(const nlohmann::json& node) -> Operation {
    if (!node.is_object()) {
        throw Exception{ErrorKind::decoding_error,
                        "operation node must be an object, got " + node.dump()};
    }
    auto it = node.find(std::string{type_key});
    if (it == node.end() || !it->is_string()) {
        throw Exception{ErrorKind::decoding_error, "operation node has no '_type' tag"};
    }
    const auto tag = it->get<std::string>();
    const auto* parse = registry_.parser(tag);
    if (!parse) {
        throw Exception{ErrorKind::decoding_error, "unknown operation tag '" + tag + "'"};
    }
    return (*parse)(node, *this);
}

auto DecodeContext::symbol(std::uint64_t serialized_id) -> Symbol {
    auto [it, inserted] = symbols_.try_emplace(serialized_id);
    if (inserted) it->second = Symbol::make();
    return it->second;
}

// =============================================================================
// OperationRegistry
// =============================================================================

OperationRegistry::OperationRegistry(std::vector<Entry> entries) {
    for (auto& entry : entries) {
        if (!entry.parser) {
            throw Exception{ErrorKind::invalid_argument,
                            "no parser given for tag '" + entry.tag + "'"};
        }
        auto [it, inserted] = parsers_.emplace(entry.tag, std::move(entry.parser));
        if (!inserted) {
            throw Exception{ErrorKind::invalid_argument,
                            "duplicate operation tag '" + entry.tag + "'"};
        }
    }
    detail::logger().debug("operation registry built with {} tags", parsers_.size());
}

auto OperationRegistry::standard() -> const OperationRegistry& {
    static const auto registry = OperationRegistry{{
        {std::string{NoOp::tag}, parse_no_op},
        {std::string{Set::tag}, parse_set},
        {std::string{Math::tag}, parse_math},
        {std::string{Apply::tag}, parse_apply},
        {std::string{List::tag}, parse_list},
        {std::string{Copy::tag}, parse_copy},
        {std::string{Paste::tag}, parse_paste},
        {std::string{Clipboard::tag}, parse_clipboard},
    }};
    return registry;
}

auto OperationRegistry::contains(std::string_view tag) const -> bool {
    return parsers_.find(tag) != parsers_.end();
}

auto OperationRegistry::parser(std::string_view tag) const -> const Parser* {
    auto it = parsers_.find(tag);
    return it != parsers_.end() ? &it->second : nullptr;
}

auto OperationRegistry::tags() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(parsers_.size());
    for (const auto& [tag, parser] : parsers_) result.push_back(tag);
    return result;
}

// =============================================================================
// serialize / deserialize
// =============================================================================

auto serialize(const Operation& op, const OperationRegistry& registry) -> nlohmann::json {
    return encode(op, registry);
}

auto deserialize(const nlohmann::json& node, int version,
                 const OperationRegistry& registry) -> Operation {
    if (version < 1 || version > protocol_version) {
        throw Exception{ErrorKind::decoding_error,
                        "unsupported protocol version " + std::to_string(version)};
    }
    auto context = DecodeContext{version, registry};
    try {
        return context.decode(node);
    } catch (const Exception& e) {
        detail::logger().warn("failed to deserialize operation: {}", e.what());
        if (e.kind() == ErrorKind::decoding_error) throw;
        throw Exception{ErrorKind::decoding_error, e.what()};
    } catch (const nlohmann::json::exception& e) {
        detail::logger().warn("failed to deserialize operation: {}", e.what());
        throw Exception{ErrorKind::decoding_error, e.what()};
    }
}

}  // namespace jot_cpp
