/// @file serialization.hpp
/// @brief Versioned JSON serialization of operations.
///
/// Every operation serializes to a tagged JSON node:
///
/// @code
/// {"_type": "objects.APPLY", "ops": {"title": {"_type": "values.SET", "value": "Hi"}}}
/// @endcode
///
/// Parsing is dispatched through an OperationRegistry, a read-only map from
/// tag to parser that is passed explicitly to serialize() and deserialize().

#pragma once

#include <jot-cpp/op.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jot_cpp {

/// The newest protocol version this library reads and writes.
inline constexpr int protocol_version = 1;

/// The key holding a node's tag.
inline constexpr std::string_view type_key = "_type";

class OperationRegistry;

/// State shared by the parsers during one deserialize() call.
///
/// Serialized symbol ids are mapped to fresh symbols, consistently within
/// the call, so that a Copy and its Pastes stay paired and never collide with
/// symbols already alive in the process.
class DecodeContext {
public:
    DecodeContext(int version, const OperationRegistry& registry)
        : version_{version}, registry_{registry} {}

    /// The protocol version of the input.
    auto version() const -> int { return version_; }

    /// Parse a nested node through the registry.
    /// @throws Exception (decoding_error) for an unknown tag or a malformed node.
    auto decode(const nlohmann::json& node) -> Operation;

    /// The live symbol that stands for a serialized symbol id.
    auto symbol(std::uint64_t serialized_id) -> Symbol;

private:
    int version_;
    const OperationRegistry& registry_;
    std::map<std::uint64_t, Symbol> symbols_;
};

/// Maps a variant tag to the function that parses it.
///
/// A registry is immutable once constructed. standard() holds every
/// variant in this library.
class OperationRegistry {
public:
    using Parser = std::function<Operation(const nlohmann::json&, DecodeContext&)>;

    /// One tag and its parser.
    struct Entry {
        std::string tag;
        Parser parser;
    };

    /// @throws Exception (invalid_argument) on a duplicate tag or empty parser.
    explicit OperationRegistry(std::vector<Entry> entries);

    /// The registry of all built-in variants, built once on first use.
    static auto standard() -> const OperationRegistry&;

    /// Check whether a tag is registered.
    auto contains(std::string_view tag) const -> bool;

    /// The parser for a tag, or nullptr.
    auto parser(std::string_view tag) const -> const Parser*;

    /// All registered tags, sorted.
    auto tags() const -> std::vector<std::string>;

private:
    std::map<std::string, Parser, std::less<>> parsers_;
};

/// Serialize an operation tree.
/// @throws Exception (encoding_error) if a variant's tag is not registered.
auto serialize(const Operation& op, const OperationRegistry& registry) -> nlohmann::json;

/// Rebuild an operation tree from its serialized form.
/// @param node The tagged JSON node.
/// @param version The protocol version the node was written with.
/// @param registry The parsers to dispatch to.
/// @throws Exception (decoding_error) for an unsupported version, an unknown
///   tag, or a malformed node.
auto deserialize(const nlohmann::json& node, int version,
                 const OperationRegistry& registry) -> Operation;

}  // namespace jot_cpp
