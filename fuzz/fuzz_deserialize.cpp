// Fuzz target for deserialize(). Exercises JSON parsing, the registry
// dispatch and every variant parser. Any operation that decodes is
// round-tripped through serialize() and must edit a document the same way.

#include <jot-cpp/jot.hpp>

#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto node = nlohmann::json::parse(data, data + size, nullptr, false);
    if (node.is_discarded()) return 0;

    const auto& registry = jot_cpp::OperationRegistry::standard();
    try {
        auto op = jot_cpp::deserialize(node, jot_cpp::protocol_version, registry);
        const auto restored = jot_cpp::deserialize(jot_cpp::serialize(op, registry),
                                                   jot_cpp::protocol_version, registry);
        const auto expected = op.apply(nlohmann::json::object());
        if (!jot_cpp::values_equal(restored.apply(nlohmann::json::object()), expected)) {
            __builtin_trap();
        }
    } catch (const jot_cpp::Exception&) {
        // Malformed input and invalid edits are reported by exception.
    }
    return 0;
}
