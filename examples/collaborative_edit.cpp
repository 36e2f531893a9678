// collaborative_edit: two peers concurrently edit a shared document
//
// Demonstrates: concurrent edits against a common base, rebase with and
//               without a conflict-resolution context, convergence

#include <jot-cpp/jot.hpp>

#include <cstdio>
#include <map>
#include <string>

namespace jot = jot_cpp;

static void print_doc(const char* label, const jot::Value& doc) {
    std::printf("%-22s %s\n", label, doc.dump().c_str());
}

int main() {
    const auto base = jot::Value::parse(R"({"title": "Team Tasks", "votes": 0, "owner": "Alice"})");
    print_doc("Base:", base);

    // Alice and Bob edit the same base concurrently
    auto alice = jot::Operation{jot::Apply{std::map<std::string, jot::Operation>{
        {"votes", jot::Math{jot::MathOperator::add, 1}},
        {"title", jot::Set{"Team Tasks (Q3)"}},
    }}};
    auto bob = jot::Operation{jot::Apply{std::map<std::string, jot::Operation>{
        {"votes", jot::Math{jot::MathOperator::add, 2}},
        {"owner", jot::Set{"Bob"}},
    }}};

    // Additions commute and the other keys are disjoint: no conflict
    if (auto rebased = alice.rebase(bob)) {
        auto [alice_after_bob, bob_after_alice] = *rebased;
        print_doc("Alice then Bob:", bob_after_alice.apply(alice.apply(base)));
        print_doc("Bob then Alice:", alice_after_bob.apply(bob.apply(base)));
    }

    // Both set the title: a conflict unless a context resolves it
    auto carol = jot::Operation{jot::put("title", "Backlog")};
    if (!alice.rebase(carol)) {
        std::printf("Alice and Carol conflict on \"title\"\n");
    }

    auto resolved = alice.rebase(carol, jot::RebaseContext{base});
    if (resolved) {
        auto [alice_after_carol, carol_after_alice] = *resolved;
        print_doc("Alice then Carol:", carol_after_alice.apply(alice.apply(base)));
        print_doc("Carol then Alice:", alice_after_carol.apply(carol.apply(base)));
    }

    std::printf("Done.\n");
    return 0;
}
