#include "rule_utils/field_value.hpp"

#include <limits>

#include <userver/utest/utest.hpp>

namespace payment_controls::rule_utils {

TEST(FieldValue, InferScalarPrefersIntegerThenNumber) {
    EXPECT_EQ(InferScalar("42"), FieldValue{int64_t{42}});
    EXPECT_EQ(InferScalar(" 7 "), FieldValue{int64_t{7}});
    EXPECT_EQ(InferScalar("4.5"), FieldValue{4.5});
    EXPECT_EQ(InferScalar("R01"), FieldValue{std::string("R01")});
    EXPECT_EQ(InferScalar("12abc"), FieldValue{std::string("12abc")});
}

TEST(FieldValue, CoerceNumeric) {
    EXPECT_EQ(CoerceNumeric(FieldValue{int64_t{3}}), 3.0);
    EXPECT_EQ(CoerceNumeric(FieldValue{true}), 1.0);
    EXPECT_EQ(CoerceNumeric(FieldValue{std::string(" 12.5 ")}), 12.5);
    EXPECT_FALSE(CoerceNumeric(FieldValue{std::string("n/a")}));
    EXPECT_FALSE(CoerceNumeric(FieldValue{}));
}

TEST(FieldValue, CoerceBooleanAcceptsOnlyTrueFalseText) {
    EXPECT_EQ(CoerceBoolean(FieldValue{false}), false);
    EXPECT_EQ(CoerceBoolean(FieldValue{std::string(" TRUE ")}), true);
    EXPECT_EQ(CoerceBoolean(FieldValue{std::string("False")}), false);
    EXPECT_FALSE(CoerceBoolean(FieldValue{std::string("yes")}));
    EXPECT_FALSE(CoerceBoolean(FieldValue{int64_t{1}}));
    EXPECT_FALSE(CoerceBoolean(FieldValue{}));
}

TEST(FieldValue, StrictEqualsDoesNotCoerceAcrossKinds) {
    EXPECT_TRUE(StrictEquals(FieldValue{int64_t{5967}}, FieldValue{5967.0}));
    EXPECT_TRUE(StrictEquals(FieldValue{std::string("R01")}, FieldValue{std::string("R01")}));
    EXPECT_FALSE(StrictEquals(FieldValue{std::string("R01")}, FieldValue{std::string("r01")}));
    EXPECT_FALSE(StrictEquals(FieldValue{std::string("5967")}, FieldValue{int64_t{5967}}));
    EXPECT_FALSE(StrictEquals(FieldValue{true}, FieldValue{int64_t{1}}));
    EXPECT_FALSE(StrictEquals(FieldValue{}, FieldValue{}));
}

TEST(FieldValue, ToString) {
    EXPECT_EQ(ToString(FieldValue{std::string("abc")}), "abc");
    EXPECT_EQ(ToString(FieldValue{int64_t{-4}}), "-4");
    EXPECT_EQ(ToString(FieldValue{2.5}), "2.5");
    EXPECT_EQ(ToString(FieldValue{6000.0}), "6000.0");
    EXPECT_EQ(ToString(FieldValue{true}), "true");
    EXPECT_EQ(ToString(FieldValue{}), "");
}

TEST(FieldValue, FormatDoubleKeepsAFractionPart) {
    EXPECT_EQ(FormatDouble(6000.0), "6000.0");
    EXPECT_EQ(FormatDouble(-3.0), "-3.0");
    EXPECT_EQ(FormatDouble(0.0), "0.0");
    EXPECT_EQ(FormatDouble(0.0312), "0.0312");
    EXPECT_EQ(FormatDouble(1e16), "1e+16");
    EXPECT_EQ(FormatDouble(std::numeric_limits<double>::infinity()), "inf");
}

TEST(FieldExtractor, TypedFieldsRespectPresence) {
    transaction::Transaction tx;
    tx.set_amount(250.0);
    tx.set_account_age_days(3);

    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("amount")), FieldValue{250.0});
    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("account_age_days")),
              FieldValue{int64_t{3}});
    EXPECT_TRUE(IsMissing(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("return_code"))));
    EXPECT_TRUE(IsMissing(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("card_present"))));
}

TEST(FieldExtractor, UnknownFieldsComeFromAttributes) {
    transaction::Transaction tx;
    (*tx.mutable_attributes())["risk_score"] = "87";
    (*tx.mutable_attributes())["channel"] = "Mobile";

    const auto risk = FieldRef::Resolve("risk_score");
    EXPECT_EQ(risk.descriptor, nullptr);
    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, risk), FieldValue{int64_t{87}});
    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("channel")),
              FieldValue{std::string("Mobile")});
    EXPECT_TRUE(IsMissing(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("velocity"))));
}

TEST(FieldExtractor, AttributesMapIsNotAField) {
    transaction::Transaction tx;
    (*tx.mutable_attributes())["attributes"] = "x";

    const auto ref = FieldRef::Resolve("attributes");
    EXPECT_EQ(ref.descriptor, nullptr);
    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, ref), FieldValue{std::string("x")});
}

TEST(FieldExtractor, UnparsedTypedCellFallsBackToAttributes) {
    transaction::Transaction tx;
    (*tx.mutable_attributes())["mcc"] = "unknown";

    EXPECT_EQ(FieldExtractor::GetFieldValue(tx, FieldRef::Resolve("mcc")),
              FieldValue{std::string("unknown")});
}

TEST(LiteralExtractor, MapsEveryLiteralKind) {
    controls::LiteralValue literal;
    EXPECT_TRUE(IsMissing(LiteralExtractor::GetLiteralValue(literal)));

    literal.set_string_value("instant");
    EXPECT_EQ(LiteralExtractor::GetLiteralValue(literal), FieldValue{std::string("instant")});
    literal.set_int_value(5000);
    EXPECT_EQ(LiteralExtractor::GetLiteralValue(literal), FieldValue{int64_t{5000}});
    literal.set_float_value(0.5);
    EXPECT_EQ(LiteralExtractor::GetLiteralValue(literal), FieldValue{0.5});
    literal.set_bool_value(false);
    EXPECT_EQ(LiteralExtractor::GetLiteralValue(literal), FieldValue{false});
}

}  // namespace payment_controls::rule_utils
