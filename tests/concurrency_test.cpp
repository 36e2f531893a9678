// Shared, immutable operations used from many Taskflow workers at once.

#include <jot-cpp/jot.hpp>

#include <gtest/gtest.h>
#include <taskflow/taskflow.hpp>

#include <atomic>
#include <cstddef>
#include <set>
#include <vector>

using namespace jot_cpp;

TEST(Concurrency, shared_operations_apply_and_rebase_from_many_threads) {
    const auto doc = Value::parse(R"({"a": 1, "b": {"c": 2}, "n": 10})");
    const auto left = Operation{List{{
        jot_cpp::rename("a", "moved"),
        Apply{"b", Apply{"c", Math{MathOperator::add, 1}}},
    }}};
    const auto right = Operation{Apply{std::map<std::string, Operation>{
        {"n", Math{MathOperator::add, 5}},
        {"b", Apply{"c", Math{MathOperator::mult, 3}}},
    }}};

    const auto expected_left = left.apply(doc);
    const auto rebased = left.rebase(right, RebaseContext{doc});
    ASSERT_TRUE(rebased.has_value());
    const auto expected_merge = rebased->first.apply(right.apply(doc));

    constexpr std::size_t task_count = 256;
    auto mismatches = std::atomic<int>{0};

    auto executor = tf::Executor{};
    auto taskflow = tf::Taskflow{};
    for (std::size_t i = 0; i < task_count; ++i) {
        taskflow.emplace([&, i] {
            if (i % 2 == 0) {
                if (left.apply(doc) != expected_left) ++mismatches;
                return;
            }
            auto result = left.rebase(right, RebaseContext{doc});
            if (!result || result->first.apply(right.apply(doc)) != expected_merge ||
                result->second.apply(left.apply(doc)) != expected_merge) {
                ++mismatches;
            }
        });
    }
    executor.run(taskflow).wait();

    EXPECT_EQ(mismatches.load(), 0);
}

TEST(Concurrency, symbols_are_unique_across_threads) {
    constexpr std::size_t task_count = 64;
    constexpr std::size_t per_task = 100;
    auto symbols = std::vector<std::vector<Symbol>>(task_count);

    auto executor = tf::Executor{};
    auto taskflow = tf::Taskflow{};
    for (std::size_t i = 0; i < task_count; ++i) {
        taskflow.emplace([&symbols, i] {
            for (std::size_t j = 0; j < per_task; ++j) {
                symbols[i].push_back(Copy{}.symbol);
            }
        });
    }
    executor.run(taskflow).wait();

    auto unique = std::set<Symbol>{};
    for (const auto& batch : symbols) unique.insert(batch.begin(), batch.end());
    EXPECT_EQ(unique.size(), task_count * per_task);
}

TEST(Concurrency, standard_registry_is_shared_safely) {
    const auto op = jot_cpp::rename("from", "to");
    const auto doc = Value::parse(R"({"from": [1, 2, 3]})");
    const auto expected = op.apply(doc);
    auto mismatches = std::atomic<int>{0};

    auto executor = tf::Executor{};
    auto taskflow = tf::Taskflow{};
    for (int i = 0; i < 128; ++i) {
        taskflow.emplace([&] {
            const auto& registry = OperationRegistry::standard();
            auto restored = deserialize(serialize(op, registry), protocol_version, registry);
            if (restored.apply(doc) != expected) ++mismatches;
        });
    }
    executor.run(taskflow).wait();

    EXPECT_EQ(mismatches.load(), 0);
}
