#include <gtest/gtest.h>

#include "domain/Decimal.hpp"

#include <limits>
#include <stdexcept>

using namespace wallet::domain;

// ============================================================================
// ТЕСТЫ: создание и строковое представление
// ============================================================================

TEST(DecimalTest, FromUnits_ToString) {
    EXPECT_EQ(Decimal::fromUnits(1000).toString(), "1000");
    EXPECT_EQ(Decimal::fromUnits(0).toString(), "0");
    EXPECT_EQ(Decimal::fromUnits(-25).toString(), "-25");
}

TEST(DecimalTest, FromString_ParsesFraction) {
    auto d = Decimal::fromString("1000.50");
    EXPECT_EQ(d.units, 1000);
    EXPECT_EQ(d.nano, 500000000);
    EXPECT_EQ(d.toString(), "1000.5");
}

TEST(DecimalTest, FromString_NegativeIsNormalized) {
    auto d = Decimal::fromString("-1.5");
    // Знак несёт units, nano всегда неотрицателен
    EXPECT_EQ(d.units, -2);
    EXPECT_EQ(d.nano, 500000000);
    EXPECT_EQ(d.toString(), "-1.5");
    EXPECT_TRUE(d.isNegative());
}

TEST(DecimalTest, FromString_SmallestUnit) {
    EXPECT_EQ(Decimal::fromString("0.000000001").toString(), "0.000000001");
}

TEST(DecimalTest, FromString_Invalid_Throws) {
    EXPECT_THROW(Decimal::fromString(""), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("abc"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("1.2.3"), std::invalid_argument);
    EXPECT_THROW(Decimal::fromString("-"), std::invalid_argument);
}

TEST(DecimalTest, FromDouble_RoundsToNano) {
    EXPECT_EQ(Decimal::fromDouble(0.0021).toString(), "0.0021");
    EXPECT_EQ(Decimal::fromDouble(476.19).toString(), "476.19");
}

TEST(DecimalTest, FromDouble_NotFinite_Throws) {
    EXPECT_THROW(Decimal::fromDouble(std::numeric_limits<double>::infinity()), std::invalid_argument);
    EXPECT_THROW(Decimal::fromDouble(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

// ============================================================================
// ТЕСТЫ: арифметика
// ============================================================================

TEST(DecimalTest, AddSubtract_Exact) {
    auto a = Decimal::fromString("0.1");
    auto b = Decimal::fromString("0.2");
    EXPECT_EQ(a + b, Decimal::fromString("0.3"));
    EXPECT_EQ((a - b).toString(), "-0.1");
}

TEST(DecimalTest, RepeatedAddition_NoDrift) {
    Decimal total;
    auto step = Decimal::fromString("0.01");
    for (int i = 0; i < 1000; ++i) {
        total += step;
    }
    EXPECT_EQ(total, Decimal::fromUnits(10));
}

TEST(DecimalTest, Multiply_TradeConversion) {
    // 100 USD по курсу 0.85 → 85 EUR
    auto converted = Decimal::fromUnits(100) * Decimal::fromDouble(0.85);
    EXPECT_EQ(converted.toString(), "85");
}

TEST(DecimalTest, Multiply_RoundsHalfUpAtNinthDigit) {
    // 0.000000001 * 0.5 = 0.0000000005 → 0.000000001
    auto tiny = Decimal::fromString("0.000000001");
    auto half = Decimal::fromString("0.5");
    EXPECT_EQ((tiny * half).toString(), "0.000000001");

    // 0.000000001 * 0.4 = 0.0000000004 → 0
    auto lessThanHalf = Decimal::fromString("0.4");
    EXPECT_TRUE((tiny * lessThanHalf).isZero());
}

TEST(DecimalTest, Multiply_Negative_RoundsAwayFromZero) {
    auto value = Decimal::fromString("-0.000000001") * Decimal::fromString("0.5");
    EXPECT_EQ(value.toString(), "-0.000000001");
}

TEST(DecimalTest, Overflow_Throws) {
    auto big = Decimal::fromUnits(std::numeric_limits<int64_t>::max());
    EXPECT_THROW(big + Decimal::fromUnits(1), std::overflow_error);
    EXPECT_THROW(big * Decimal::fromUnits(2), std::overflow_error);
}

// ============================================================================
// ТЕСТЫ: сравнение
// ============================================================================

TEST(DecimalTest, Comparison) {
    auto a = Decimal::fromString("10.5");
    auto b = Decimal::fromString("10.25");

    EXPECT_TRUE(b < a);
    EXPECT_TRUE(a > b);
    EXPECT_TRUE(a >= a);
    EXPECT_TRUE(b <= a);
    EXPECT_NE(a, b);
    EXPECT_TRUE(Decimal::fromString("-0.5") < Decimal());
}

TEST(DecimalTest, Sign) {
    EXPECT_TRUE(Decimal().isZero());
    EXPECT_FALSE(Decimal().isPositive());
    EXPECT_TRUE(Decimal::fromString("0.000000001").isPositive());
    EXPECT_FALSE(Decimal::fromString("-0.000000001").isPositive());
}
