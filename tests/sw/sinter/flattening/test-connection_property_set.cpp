#include "sinter/flattening/connection_property_set.h"

#include "sinter/flattening/synapse_flattener.h"
#include "sinter/test_helper/models.h"
#include <gtest/gtest.h>

using namespace sinter::flattening;
using namespace sinter::dynamics;
using namespace sinter::test_helper;

TEST(extract_connection_property_sets, General)
{
	ArrayValue const weights({0.1, 0.2, 0.3});

	auto const varying =
	    extract_connection_property_sets(exponential_synapse_properties(weights), "P");
	ASSERT_TRUE(std::holds_alternative<std::vector<ConnectionPropertySet>>(varying));
	std::vector<ConnectionPropertySet> const expected{
	    ConnectionPropertySet{"spike__P", {{"weight__P", Quantity(weights, "nA")}}}};
	EXPECT_EQ(std::get<std::vector<ConnectionPropertySet>>(varying), expected);

	// properties shared by all instances stay in the dynamics
	auto const single =
	    extract_connection_property_sets(exponential_synapse_properties(SingleValue(1.)), "P");
	ASSERT_TRUE(std::holds_alternative<std::vector<ConnectionPropertySet>>(single));
	EXPECT_TRUE(std::get<std::vector<ConnectionPropertySet>>(single).empty());

	auto random_tau = exponential_synapse_properties(SingleValue(1.));
	random_tau.properties.at("tau") =
	    Quantity(RandomDistributionValue("normal", {{"mu", 5.}, {"sigma", 1.}}), "ms");
	EXPECT_TRUE(
	    std::holds_alternative<Unflattenable>(extract_connection_property_sets(random_tau, "P")));
}

TEST(extract_connection_property_sets, ContinuousDependency)
{
	auto const driven =
	    extract_connection_property_sets(driven_synapse_properties(ArrayValue({1., 2.})), "P");
	ASSERT_TRUE(std::holds_alternative<Unflattenable>(driven));
	EXPECT_FALSE(std::get<Unflattenable>(driven).reason.empty());

	auto const driven_single =
	    extract_connection_property_sets(driven_synapse_properties(SingleValue(1.)), "P");
	EXPECT_TRUE(std::holds_alternative<std::vector<ConnectionPropertySet>>(driven_single));

	// dependency through alias
	auto dynamics = exponential_synapse_dynamics();
	dynamics.aliases.push_back(Alias{"drive", Expression::symbol("weight")});
	dynamics.regimes.at(0).time_derivatives.at(0).rhs =
	    Expression::symbol("drive") - Expression::symbol("g");
	DynamicsProperties const aliased(
	    "aliased", dynamics, exponential_synapse_properties(ArrayValue({1., 2.})).properties);
	EXPECT_TRUE(
	    std::holds_alternative<Unflattenable>(extract_connection_property_sets(aliased, "P")));
}

TEST(extract_connection_property_sets, FlattenedSynapse)
{
	ArrayValue const weights({0.5, 1.5});
	auto const flattened = flatten_synapse(
	    make_projection("P", "A", "B", exponential_synapse_properties(weights)));

	auto const extraction = extract_connection_property_sets(flattened.synapse, "P");
	ASSERT_TRUE(std::holds_alternative<std::vector<ConnectionPropertySet>>(extraction));
	auto const& sets = std::get<std::vector<ConnectionPropertySet>>(extraction);
	ASSERT_EQ(sets.size(), 1);
	EXPECT_EQ(sets.at(0).port, "spike__psr__P");
	ASSERT_EQ(sets.at(0).properties.size(), 1);
	EXPECT_EQ(sets.at(0).properties.at("weight__psr__P"), Quantity(weights, "nA"));
}
