// basic_usage: demonstrates the core jot-cpp API
//
// Shows building edits with put/remove/rename and Apply, applying them,
// composing, simplifying, inverting, and serializing to JSON.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <jot-cpp/jot.hpp>

#include <cstdio>
#include <map>
#include <string>

namespace jot = jot_cpp;

int main() {
    auto doc = jot::Value::parse(R"({"title": "Shopping List", "count": 2, "draft": true})");
    std::printf("Initial:    %s\n", doc.dump().c_str());

    // -- Convenience edits ----------------------------------------------------
    doc = jot::put("owner", "Alice").apply(doc);
    doc = jot::remove("draft").apply(doc);
    doc = jot::rename("title", "name").apply(doc);
    std::printf("Edited:     %s\n", doc.dump().c_str());

    // -- Several keys at once -------------------------------------------------
    auto edit = jot::Operation{jot::Apply{std::map<std::string, jot::Operation>{
        {"count", jot::Math{jot::MathOperator::add, 3}},
        {"items", jot::Set{jot::Value::array({"milk", "eggs"})}},
    }}};
    std::printf("Edit:       %s\n", jot::to_string(edit).c_str());

    auto before = doc;
    doc = edit.apply(doc);
    std::printf("Applied:    %s\n", doc.dump().c_str());

    // -- Inverse --------------------------------------------------------------
    auto undo = edit.inverse(before);
    std::printf("Undone:     %s\n", undo.apply(doc).dump().c_str());

    // -- Compose and simplify -------------------------------------------------
    auto twice = edit.then(jot::Apply{"count", jot::Math{jot::MathOperator::add, -3}});
    std::printf("Composed:   %s\n", jot::to_string(twice.simplify()).c_str());

    // -- Serialization --------------------------------------------------------
    const auto& registry = jot::OperationRegistry::standard();
    auto node = jot::serialize(jot::rename("name", "title"), registry);
    std::printf("Serialized: %s\n", node.dump().c_str());

    auto restored = jot::deserialize(node, jot::protocol_version, registry);
    std::printf("Restored:   %s\n", restored.apply(doc).dump().c_str());

    std::printf("Done.\n");
    return 0;
}
