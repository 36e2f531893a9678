#include <jot-cpp/error.hpp>
#include <jot-cpp/op.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace jot_cpp;

// -- NoOp ---------------------------------------------------------------------

TEST(NoOp, default_operation_is_no_op) {
    const auto op = Operation{};
    EXPECT_TRUE(op.is_no_op());
    EXPECT_EQ(op.tag(), "values.NO_OP");
}

TEST(NoOp, apply_returns_document_unchanged) {
    const auto doc = Value::parse(R"({"a": [1, 2]})");
    EXPECT_EQ(Operation{}.apply(doc), doc);
}

TEST(NoOp, simplify_and_inverse_are_no_op) {
    EXPECT_TRUE(Operation{}.simplify().is_no_op());
    EXPECT_TRUE(Operation{}.inverse(Value(5)).is_no_op());
}

TEST(NoOp, composes_to_the_other_operation) {
    const auto set = Operation{Set{7}};
    auto left = Operation{}.compose(set);
    auto right = set.compose(Operation{});
    ASSERT_TRUE(left.has_value());
    ASSERT_TRUE(right.has_value());
    EXPECT_EQ(*left, set);
    EXPECT_EQ(*right, set);
}

// -- Set ----------------------------------------------------------------------

TEST(Set, holds_the_value_itself) {
    const auto set = Set{5};
    EXPECT_TRUE(set.value.is_number());
    EXPECT_EQ(set.value, Value(5));

    const auto array = Set{Value::array({1, 2})};
    EXPECT_EQ(array.value.size(), 2u);

    EXPECT_TRUE(is_missing(Set{missing()}.value));
}

TEST(Set, apply_replaces_value) {
    EXPECT_EQ(Operation{Set{"new"}}.apply(Value(1)), Value("new"));
}

TEST(Set, set_missing_yields_missing) {
    EXPECT_TRUE(is_missing(Operation{Set{missing()}}.apply(Value(1))));
}

TEST(Set, inverse_restores_prior_value) {
    const auto op = Operation{Set{10}};
    const auto inverse = op.inverse(Value(3));
    EXPECT_EQ(inverse, Operation{Set{3}});
    EXPECT_EQ(inverse.apply(op.apply(Value(3))), Value(3));
}

TEST(Set, equality_distinguishes_missing_from_null) {
    EXPECT_EQ(Operation{Set{missing()}}, Operation{Set{missing()}});
    EXPECT_NE(Operation{Set{missing()}}, Operation{Set{nullptr}});
}

TEST(Set, compose_with_set_keeps_the_later) {
    auto composed = Operation{Set{1}}.compose(Set{2});
    ASSERT_TRUE(composed.has_value());
    EXPECT_EQ(*composed, Operation{Set{2}});
}

TEST(Set, compose_folds_following_math) {
    auto composed = Operation{Set{10}}.compose(Math{MathOperator::add, 5});
    ASSERT_TRUE(composed.has_value());
    EXPECT_EQ(*composed, Operation{Set{15}});
}

TEST(Set, compose_with_copy_is_not_representable) {
    EXPECT_FALSE(Operation{Set{1}}.compose(Copy{}).has_value());
}

TEST(Set, prints_tag_and_value) {
    EXPECT_EQ(to_string(Operation{Set{5}}), "<values.SET 5>");
    EXPECT_EQ(to_string(Operation{Set{missing()}}), "<values.SET MISSING>");
}

// -- Math ---------------------------------------------------------------------

TEST(Math, add_keeps_integers_integral) {
    const auto result = Operation{Math{MathOperator::add, 3}}.apply(Value(4));
    EXPECT_TRUE(result.is_number_integer());
    EXPECT_EQ(result, Value(7));
}

TEST(Math, add_with_a_double_yields_a_double) {
    const auto result = Operation{Math{MathOperator::add, 1}}.apply(Value(1.5));
    EXPECT_TRUE(result.is_number_float());
    EXPECT_DOUBLE_EQ(result.get<double>(), 2.5);
}

TEST(Math, mult_multiplies) {
    const auto op = Operation{Math{MathOperator::mult, 3}};
    EXPECT_EQ(op.apply(Value(4)), Value(12));
}

TEST(Math, apply_to_non_number_throws_type_mismatch) {
    try {
        Operation{Math{MathOperator::add, 1}}.apply(Value("text"));
        FAIL() << "expected type_mismatch";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::type_mismatch);
    }
}

TEST(Math, apply_to_missing_throws_type_mismatch) {
    const auto op = Operation{Math{MathOperator::add, 1}};
    EXPECT_THROW(op.apply(missing()), Exception);
}

TEST(Math, non_numeric_operand_is_rejected) {
    try {
        auto op = Math{MathOperator::add, "1"};
        (void)op;
        FAIL() << "expected invalid_argument";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_argument);
    }
}

TEST(Math, identities_simplify_to_no_op) {
    const auto add_zero = Operation{Math{MathOperator::add, 0}};
    const auto mult_one = Operation{Math{MathOperator::mult, 1}};
    const auto add_two = Operation{Math{MathOperator::add, 2}};
    EXPECT_TRUE(add_zero.simplify().is_no_op());
    EXPECT_TRUE(mult_one.simplify().is_no_op());
    EXPECT_FALSE(add_two.simplify().is_no_op());
}

TEST(Math, inverse_of_add_subtracts) {
    const auto inverse = Operation{Math{MathOperator::add, 3}}.inverse(Value(10));
    EXPECT_EQ(inverse, (Operation{Math{MathOperator::add, -3}}));
}

TEST(Math, inverse_of_mult_restores_prior_value) {
    const auto op = Operation{Math{MathOperator::mult, 0}};
    const auto inverse = op.inverse(Value(9));
    EXPECT_EQ(inverse.apply(op.apply(Value(9))), Value(9));
}

TEST(Math, compose_same_operator_folds) {
    auto sum = Operation{Math{MathOperator::add, 2}}.compose(Math{MathOperator::add, 3});
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(*sum, (Operation{Math{MathOperator::add, 5}}));

    auto product = Operation{Math{MathOperator::mult, 2}}.compose(Math{MathOperator::mult, 3});
    ASSERT_TRUE(product.has_value());
    EXPECT_EQ(*product, (Operation{Math{MathOperator::mult, 6}}));
}

TEST(Math, compose_mixed_operators_is_not_representable) {
    const auto add = Operation{Math{MathOperator::add, 2}};
    EXPECT_FALSE(add.compose(Math{MathOperator::mult, 3}).has_value());
}

TEST(Math, then_falls_back_to_a_list) {
    const auto add = Operation{Math{MathOperator::add, 2}};
    const auto mult = Operation{Math{MathOperator::mult, 3}};
    const auto both = add.then(mult);
    ASSERT_TRUE(both.is<List>());
    EXPECT_EQ(both.apply(Value(1)), Value(9));
}

TEST(Math, compose_with_set_yields_the_set) {
    auto composed = Operation{Math{MathOperator::add, 2}}.compose(Set{0});
    ASSERT_TRUE(composed.has_value());
    EXPECT_EQ(*composed, Operation{Set{0}});
}

TEST(Math, integer_overflow_falls_back_to_double) {
    const auto max = std::numeric_limits<std::int64_t>::max();
    const auto min = std::numeric_limits<std::int64_t>::min();

    const auto sum = Operation{Math{MathOperator::add, 1}}.apply(Value(max));
    EXPECT_TRUE(sum.is_number_float());
    EXPECT_DOUBLE_EQ(sum.get<double>(), static_cast<double>(max) + 1.0);

    const auto difference = Operation{Math{MathOperator::add, -1}}.apply(Value(min));
    EXPECT_TRUE(difference.is_number_float());

    const auto product = Operation{Math{MathOperator::mult, 2}}.apply(Value(max));
    EXPECT_TRUE(product.is_number_float());
    EXPECT_DOUBLE_EQ(product.get<double>(), static_cast<double>(max) * 2.0);
}

TEST(Math, integers_at_the_boundary_stay_integral) {
    const auto max = std::numeric_limits<std::int64_t>::max();
    const auto min = std::numeric_limits<std::int64_t>::min();

    const auto below_max = Operation{Math{MathOperator::add, 1}}.apply(Value(max - 1));
    EXPECT_TRUE(below_max.is_number_integer());
    EXPECT_EQ(below_max.get<std::int64_t>(), max);

    const auto negated = Operation{Math{MathOperator::mult, -1}}.apply(Value(max));
    EXPECT_TRUE(negated.is_number_integer());
    EXPECT_EQ(negated.get<std::int64_t>(), -max);

    const auto flipped = Operation{Math{MathOperator::mult, -1}}.apply(Value(min));
    EXPECT_TRUE(flipped.is_number_float());
}

TEST(Math, large_unsigned_values_are_not_wrapped) {
    const auto big = Value(std::uint64_t{18000000000000000000u});
    const auto sum = Operation{Math{MathOperator::add, 1}}.apply(big);
    EXPECT_TRUE(sum.is_number_float());
    EXPECT_GT(sum.get<double>(), 1.7e19);
}

TEST(Math, inverse_of_an_overflowing_add_restores_prior_value) {
    const auto max = Value(std::numeric_limits<std::int64_t>::max());
    const auto op = Operation{Math{MathOperator::add, 1}};
    const auto inverse = op.inverse(max);
    EXPECT_EQ(inverse, Operation{Set{max}});
    EXPECT_EQ(inverse.apply(op.apply(max)), max);
}

TEST(Math, prints_operator_and_operand) {
    const auto op = Operation{Math{MathOperator::add, 3}};
    EXPECT_EQ(to_string(op), "<values.MATH add:3>");
    EXPECT_EQ(to_string_view(MathOperator::mult), "mult");
}

// -- Drilldown ----------------------------------------------------------------

TEST(Drilldown, no_op_drills_down_to_no_op) {
    EXPECT_TRUE(Operation{}.drilldown(std::string{"any"}).is_no_op());
}

TEST(Drilldown, value_operations_cannot_be_addressed) {
    try {
        Operation{Set{1}}.drilldown(std::string{"k"});
        FAIL() << "expected invalid_operation";
    } catch (const Exception& e) {
        EXPECT_EQ(e.kind(), ErrorKind::invalid_operation);
    }
}
