// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include <jot-cpp/jot.hpp>

#include <filesystem>
#include <fstream>
#include <map>
#include <string>

static void write_seed(const std::string& path, const jot_cpp::Operation& op) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs << jot_cpp::serialize(op, jot_cpp::OperationRegistry::standard()).dump();
}

int main() {
    namespace fs = std::filesystem;
    namespace jot = jot_cpp;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: identity
    write_seed(dir + "/seed_no_op.json", jot::Operation{});

    // Seed 2: single put
    write_seed(dir + "/seed_put.json", jot::put("key", 42));

    // Seed 3: removal
    write_seed(dir + "/seed_remove.json", jot::remove("key"));

    // Seed 4: several keys with arithmetic
    write_seed(dir + "/seed_multi_key.json",
               jot::Apply{std::map<std::string, jot::Operation>{
                   {"a", jot::Math{jot::MathOperator::add, 1}},
                   {"b", jot::Math{jot::MathOperator::mult, 2.5}},
                   {"c", jot::Set{jot::Value::parse(R"({"nested": [1, 2]})")}},
               }});

    // Seed 5: rename (clipboard, list, copy and paste)
    write_seed(dir + "/seed_rename.json", jot::rename("from", "to"));

    // Seed 6: nested object edit
    write_seed(dir + "/seed_nested.json",
               jot::Apply{"outer", jot::Apply{"inner", jot::Set{"value"}}});

    return 0;
}
