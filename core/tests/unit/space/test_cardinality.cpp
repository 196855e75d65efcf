// tests/space/test_cardinality.cpp - Unit tests for region size arithmetic
//
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "nstg/space/cardinality.hpp"

using namespace nstg;

TEST(CardinalityTest, FiniteArithmetic)
{
  EXPECT_EQ(Cardinality::finite(3) + Cardinality::finite(4), Cardinality::finite(7));
  EXPECT_EQ(Cardinality::finite(3) * Cardinality::finite(4), Cardinality::finite(12));
  EXPECT_EQ(Cardinality::finite(0) * Cardinality::finite(9), Cardinality::finite(0));
}

TEST(CardinalityTest, InfiniteAbsorbs)
{
  const Cardinality inf = Cardinality::infinite();
  EXPECT_TRUE((inf + Cardinality::finite(1)).is_infinite());
  EXPECT_TRUE((Cardinality::finite(1) + inf).is_infinite());
  EXPECT_TRUE((inf * Cardinality::finite(2)).is_infinite());
  EXPECT_TRUE((Cardinality::finite(2) * inf).is_infinite());
  // Infinity absorbs even an empty factor
  EXPECT_TRUE((inf * Cardinality::finite(0)).is_infinite());
}

TEST(CardinalityTest, OverflowBecomesInfinite)
{
  const Cardinality big = Cardinality::finite(std::numeric_limits<uint64_t>::max());
  EXPECT_TRUE((big + Cardinality::finite(1)).is_infinite());
  EXPECT_TRUE((big * Cardinality::finite(2)).is_infinite());
}

TEST(CardinalityTest, OrderingPutsInfiniteLast)
{
  EXPECT_TRUE(Cardinality::finite(1) < Cardinality::finite(2));
  EXPECT_TRUE(Cardinality::finite(1000) < Cardinality::infinite());
  EXPECT_FALSE(Cardinality::infinite() < Cardinality::finite(1));
  EXPECT_FALSE(Cardinality::infinite() < Cardinality::infinite());
}

TEST(CardinalityTest, AtMostAndToString)
{
  EXPECT_TRUE(Cardinality::finite(10).at_most(10));
  EXPECT_FALSE(Cardinality::finite(11).at_most(10));
  EXPECT_FALSE(Cardinality::infinite().at_most(10));
  EXPECT_EQ(Cardinality::finite(7).to_string(), "7");
  EXPECT_EQ(Cardinality::infinite().to_string(), "infinite");
}
