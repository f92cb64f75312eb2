#include "sinter/common/namespace.h"

#include <stdexcept>
#include <gtest/gtest.h>

using namespace sinter::common;

TEST(Namespace, General)
{
	EXPECT_EQ(append_namespace("spike", "psr"), "spike__psr");
	EXPECT_EQ(append_namespace(append_namespace("spike", "psr"), "P"), "spike__psr__P");

	EXPECT_FALSE(is_namespaced("spike"));
	EXPECT_TRUE(is_namespaced("spike__psr"));
	// a single underscore is part of a plain name
	EXPECT_FALSE(is_namespaced("v_reset"));

	EXPECT_EQ(split_namespace("spike__psr"), std::make_pair(std::string("psr"), std::string("spike")));
	EXPECT_EQ(
	    split_namespace("spike__psr__P"),
	    std::make_pair(std::string("P"), std::string("spike__psr")));
	EXPECT_THROW(split_namespace("spike"), std::invalid_argument);
}
