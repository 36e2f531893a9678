// Randomized checks of the laws every operation obeys, over many seeds.

#include <jot-cpp/objects.hpp>
#include <jot-cpp/random.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace jot_cpp;

namespace {

constexpr auto seeds = 300;

// A random object document with a few levels of nesting.
auto random_document(RandomEngine& rng) -> Value {
    auto doc = Value::object();
    for (int i = 0; i < 6; ++i) {
        doc = random_object_operation(doc, rng).apply(doc);
    }
    return doc;
}

}  // namespace

TEST(Laws, seeds_cover_copy_and_paste) {
    auto pasting = 0;
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        if (uses_paste_buffer(random_object_operation(doc, rng))) ++pasting;
    }
    EXPECT_GT(pasting, seeds / 20);
}

TEST(Laws, simplify_is_idempotent_and_preserves_meaning) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto first = random_object_operation(doc, rng);
        const auto second = random_object_operation(first.apply(doc), rng);
        const auto op = Operation{List{{first, second}}};

        const auto once = op.simplify();
        EXPECT_EQ(once.simplify(), once) << "seed " << seed << ": " << op;
        EXPECT_EQ(once.apply(doc), op.apply(doc)) << "seed " << seed << ": " << op;
    }
}

TEST(Laws, inverse_undoes_apply) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto op = random_object_operation(doc, rng);
        const auto after = op.apply(doc);
        EXPECT_EQ(op.inverse(doc).apply(after), doc) << "seed " << seed << ": " << op;
    }
}

TEST(Laws, compose_matches_sequential_apply) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto first = random_object_operation(doc, rng);
        const auto middle = first.apply(doc);
        const auto second = random_object_operation(middle, rng);
        const auto expected = second.apply(middle);

        EXPECT_EQ(first.then(second).apply(doc), expected) << "seed " << seed;
        if (auto composed = first.compose(second)) {
            EXPECT_EQ(composed->apply(doc), expected)
                << "seed " << seed << ": " << first << " then " << second;
        }
    }
}

TEST(Laws, conflictless_rebase_converges) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto a = random_object_operation(doc, rng);
        const auto b = random_object_operation(doc, rng);

        auto rebased = a.rebase(b, RebaseContext{doc});
        ASSERT_TRUE(rebased.has_value()) << "seed " << seed << ": " << a << " vs " << b;
        const auto& [a_after_b, b_after_a] = *rebased;
        EXPECT_EQ(a_after_b.apply(b.apply(doc)), b_after_a.apply(a.apply(doc)))
            << "seed " << seed << ": " << a << " vs " << b;
    }
}

TEST(Laws, rebase_without_context_converges_when_it_succeeds) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto a = random_object_operation(doc, rng);
        const auto b = random_object_operation(doc, rng);

        if (auto rebased = a.rebase(b)) {
            const auto& [a_after_b, b_after_a] = *rebased;
            EXPECT_EQ(a_after_b.apply(b.apply(doc)), b_after_a.apply(a.apply(doc)))
                << "seed " << seed << ": " << a << " vs " << b;
        }
    }
}

TEST(Laws, disjoint_keys_rebase_without_conflict) {
    for (auto seed = 0; seed < seeds; ++seed) {
        auto rng = RandomEngine{static_cast<RandomEngine::result_type>(seed)};
        const auto doc = random_document(rng);
        const auto a = put("left" + std::to_string(seed), random_value(rng));
        const auto b = put("right" + std::to_string(seed), random_value(rng));

        auto rebased = a.rebase(b);
        ASSERT_TRUE(rebased.has_value()) << "seed " << seed;
        EXPECT_EQ(rebased->first, a);
        EXPECT_EQ(rebased->second, b);
    }
}
