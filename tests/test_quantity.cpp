#include <gtest/gtest.h>
#include "domain/quantity.hpp"

#include <limits>

TEST(Quantity, FromDouble) {
  const Quantity q = Quantity::from_double(1.5, 4);
  EXPECT_EQ(q.raw(), 15000u);
  EXPECT_EQ(q.precision(), 4);
  EXPECT_DOUBLE_EQ(q.as_double(), 1.5);
  EXPECT_EQ(q.to_string(), "1.5000");

  EXPECT_TRUE(Quantity::from_double(-0.0, 3).is_zero());
  EXPECT_DOUBLE_EQ(Quantity::from_double(QUANTITY_MAX, 9).as_double(), QUANTITY_MAX);
}

TEST(Quantity, FromDoubleRejects) {
  EXPECT_THROW(Quantity::from_double(-1.0, 0), InvalidInput);
  EXPECT_THROW(Quantity::from_double(QUANTITY_MAX + 1.0, 0), NumericOverflow);
  EXPECT_THROW(Quantity::from_double(std::numeric_limits<double>::infinity(), 0), InvalidInput);
  EXPECT_THROW(Quantity::from_double(std::numeric_limits<double>::quiet_NaN(), 0), InvalidInput);
  EXPECT_THROW(Quantity::from_double(1.0, 10), InvalidPrecision);
}

TEST(Quantity, FromString) {
  EXPECT_EQ(Quantity::from_string("0.010").raw(), 10u);
  EXPECT_EQ(Quantity::from_string("0.010").precision(), 3);
  EXPECT_EQ(Quantity::from_string("-0.00").raw(), 0u);
  EXPECT_EQ(Quantity::from_string("18446744073709551615").raw(), std::numeric_limits<uint64_t>::max());
  EXPECT_THROW(Quantity::from_string("-1"), InvalidInput);
  EXPECT_THROW(Quantity::from_string("18446744073709551616"), NumericOverflow);
  EXPECT_THROW(Quantity::from_string("abc"), InvalidInput);
}

TEST(Quantity, RescaleAndArithmetic) {
  EXPECT_EQ(Quantity::from_raw(25, 1).rescale(0).raw(), 2u);   // 2.5 -> 2
  EXPECT_EQ(Quantity::from_raw(35, 1).rescale(0).raw(), 4u);   // 3.5 -> 4
  EXPECT_EQ(Quantity::from_raw(3, 0).rescale(2).raw(), 300u);
  EXPECT_THROW(Quantity::from_raw(std::numeric_limits<uint64_t>::max(), 0).rescale(1), NumericOverflow);

  const Quantity a = Quantity::from_raw(10, 2);
  const Quantity b = Quantity::from_raw(4, 2);
  EXPECT_EQ((a + b).raw(), 14u);
  EXPECT_EQ((a - b).raw(), 6u);
  EXPECT_THROW(b - a, NumericOverflow);
  EXPECT_THROW(a + Quantity::from_raw(1, 1), InvalidPrecision);
  EXPECT_THROW(Quantity::from_raw(std::numeric_limits<uint64_t>::max(), 0) + Quantity::from_raw(1, 0),
               NumericOverflow);
}

TEST(Quantity, ComparesByValueAcrossPrecisions) {
  EXPECT_EQ(Quantity::from_raw(100, 2), Quantity::from_raw(1, 0));
  EXPECT_LT(Quantity::from_raw(99, 2), Quantity::from_raw(1, 0));
  EXPECT_GE(Quantity::from_raw(std::numeric_limits<uint64_t>::max(), 0), Quantity::from_raw(1, 9));
}
