#include "sinter/dynamics/value.h"

#include <sstream>
#include <gtest/gtest.h>

using namespace sinter::dynamics;

TEST(Value, General)
{
	EXPECT_TRUE(SingleValue(1.).is_single());
	EXPECT_FALSE(ArrayValue({1., 2.}).is_single());
	EXPECT_FALSE(RandomDistributionValue("normal", {{"mu", 0.}, {"sigma", 1.}}).is_single());

	EXPECT_EQ(SingleValue(1.), SingleValue(1.));
	EXPECT_NE(SingleValue(1.), SingleValue(2.));
	EXPECT_NE(SingleValue(1.), ArrayValue({1.}));
	EXPECT_EQ(ArrayValue({1., 2.}), ArrayValue({1., 2.}));
	EXPECT_NE(
	    RandomDistributionValue("normal", {{"mu", 0.}}),
	    RandomDistributionValue("uniform", {{"mu", 0.}}));
}

TEST(Quantity, General)
{
	Quantity const quantity(SingleValue(2.), "ms");
	EXPECT_TRUE(quantity.is_single());
	EXPECT_EQ(quantity, Quantity(SingleValue(2.), "ms"));
	EXPECT_NE(quantity, Quantity(SingleValue(2.), "s"));
	EXPECT_NE(quantity, Quantity(ArrayValue({2.}), "ms"));

	Quantity const unset;
	EXPECT_THROW(unset.is_single(), std::runtime_error);

	std::stringstream ss;
	ss << unset;
	EXPECT_FALSE(ss.str().empty());
}
