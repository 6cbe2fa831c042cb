#include "condition/condition.hpp"

#include <initializer_list>

#include <userver/utest/utest.hpp>

#include "rule_utils/errors.hpp"

namespace payment_controls {

namespace {

controls::Condition Raw(std::string key, controls::LiteralValue literal) {
    controls::Condition raw;
    raw.set_key(std::move(key));
    *raw.mutable_literal() = std::move(literal);
    return raw;
}

controls::LiteralValue Str(std::string value) {
    controls::LiteralValue literal;
    literal.set_string_value(std::move(value));
    return literal;
}

controls::LiteralValue Int(int64_t value) {
    controls::LiteralValue literal;
    literal.set_int_value(value);
    return literal;
}

controls::LiteralValue Bool(bool value) {
    controls::LiteralValue literal;
    literal.set_bool_value(value);
    return literal;
}

controls::Condition RawList(std::string key, std::initializer_list<controls::LiteralValue> values) {
    controls::Condition raw;
    raw.set_key(std::move(key));
    auto* list = raw.mutable_list();
    for (const auto& value : values) {
        *list->add_values() = value;
    }
    return raw;
}

}  // namespace

TEST(CompileCondition, MembershipSuffix) {
    const auto condition = CompileCondition(RawList("return_code_in", {Str("R01"), Str("R10")}));
    const auto* membership = std::get_if<MembershipIn>(&condition);
    ASSERT_NE(membership, nullptr);
    EXPECT_EQ(membership->field.name, "return_code");
    EXPECT_NE(membership->field.descriptor, nullptr);
    ASSERT_EQ(membership->values.size(), 2u);
    // Membership keeps the declared case.
    EXPECT_EQ(membership->values[0], rule_utils::FieldValue{std::string("R01")});
}

TEST(CompileCondition, DaySuffixWithAlias) {
    const auto condition = CompileCondition(Raw("account_age_lt_days", Int(30)));
    const auto* compare = std::get_if<NumericCompare>(&condition);
    ASSERT_NE(compare, nullptr);
    EXPECT_EQ(compare->field.name, "account_age_days");
    EXPECT_EQ(compare->op, CompareOp::kLess);
    EXPECT_DOUBLE_EQ(compare->threshold, 30.0);
}

TEST(CompileCondition, PlainComparisonSuffixes) {
    const auto gt = std::get<NumericCompare>(CompileCondition(Raw("amount_gt", Int(5000))));
    EXPECT_EQ(gt.field.name, "amount");
    EXPECT_EQ(gt.op, CompareOp::kGreater);

    const auto gte = std::get<NumericCompare>(CompileCondition(Raw("wallet_age_gte", Int(7))));
    EXPECT_EQ(gte.field.name, "wallet_age_days");
    EXPECT_EQ(gte.op, CompareOp::kGreaterOrEqual);

    const auto lte = std::get<NumericCompare>(CompileCondition(Raw("risk_score_lte", Str("0.25"))));
    EXPECT_EQ(lte.field.name, "risk_score");
    EXPECT_EQ(lte.field.descriptor, nullptr);
    EXPECT_EQ(lte.op, CompareOp::kLessOrEqual);
    EXPECT_DOUBLE_EQ(lte.threshold, 0.25);
}

TEST(CompileCondition, DaySuffixOnUnaliasedField) {
    const auto compare = std::get<NumericCompare>(CompileCondition(Raw("dormancy_gte_days", Int(90))));
    EXPECT_EQ(compare.field.name, "dormancy");
    EXPECT_EQ(compare.op, CompareOp::kGreaterOrEqual);
}

TEST(CompileCondition, BooleanAndEquality) {
    const auto flag = CompileCondition(Raw("is_new_device", Bool(true)));
    ASSERT_TRUE(std::holds_alternative<BooleanEquals>(flag));
    EXPECT_TRUE(std::get<BooleanEquals>(flag).expected);

    const auto text = std::get<Equals>(CompileCondition(Raw("funding_speed", Str("INSTANT"))));
    EXPECT_EQ(text.field.name, "funding_speed");
    EXPECT_EQ(text.expected, rule_utils::FieldValue{std::string("instant")});

    const auto number = std::get<Equals>(CompileCondition(Raw("mcc", Int(5967))));
    EXPECT_EQ(number.expected, rule_utils::FieldValue{int64_t{5967}});

    const auto null = std::get<Equals>(CompileCondition(Raw("country", controls::LiteralValue{})));
    EXPECT_TRUE(rule_utils::IsMissing(null.expected));
}

TEST(CompileCondition, RejectsMisshapenValues) {
    EXPECT_THROW(CompileCondition(RawList("mcc", {Int(1)})), ConfigError);
    EXPECT_THROW(CompileCondition(Raw("mcc_in", Int(1))), ConfigError);
    EXPECT_THROW(CompileCondition(Raw("amount_gt", Str("lots"))), ConfigError);
    EXPECT_THROW(CompileCondition(Raw("amount_gt", Bool(true))), ConfigError);
    EXPECT_THROW(CompileCondition(Raw("_in", Int(1))), ConfigError);
    EXPECT_THROW(CompileCondition(RawList("_in", {Int(1)})), ConfigError);
    EXPECT_THROW(CompileCondition(Raw("", Int(1))), ConfigError);
}

TEST(CompileCondition, ConditionFieldOfEveryKind) {
    EXPECT_EQ(ConditionField(CompileCondition(Raw("amount_lt", Int(1)))).name, "amount");
    EXPECT_EQ(ConditionField(CompileCondition(Raw("card_present", Bool(false)))).name, "card_present");
    EXPECT_EQ(ToString(CompareOp::kGreaterOrEqual), ">=");
}

}  // namespace payment_controls
