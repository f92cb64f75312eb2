#include "sinter/network/network_builder.h"

#include "sinter/exception.h"
#include "sinter/test_helper/models.h"
#include <stdexcept>
#include <gtest/gtest.h>

using namespace sinter::network;
using namespace sinter::dynamics;
using namespace sinter::test_helper;

TEST(NetworkBuilder, General)
{
	NetworkBuilder builder;

	Population const population_a("A", 10, iaf_properties());
	Population const population_b("B", 5, iaf_properties());
	builder.add(population_a);
	builder.add(population_b);

	Selection const selection{"S", {"A", "B"}};
	builder.add(selection);

	auto const projection =
	    make_projection("P", "A", "S", exponential_synapse_properties(SingleValue(1.)));
	builder.add(projection);

	auto const network = builder.done();
	ASSERT_TRUE(network);
	EXPECT_EQ(network->populations.size(), 2);
	EXPECT_EQ(network->populations.at("A"), population_a);
	EXPECT_EQ(network->selections.at("S"), selection);
	EXPECT_EQ(network->projections.at("P"), projection);

	EXPECT_EQ(network->resolve("A"), std::vector<std::string>{"A"});
	EXPECT_EQ(network->resolve("S"), (std::vector<std::string>{"A", "B"}));
	EXPECT_THROW(network->resolve("P"), std::out_of_range);
	EXPECT_TRUE(network->is_selection("S"));
	EXPECT_FALSE(network->is_selection("A"));

	// builder is reset
	auto const empty = builder.done();
	EXPECT_TRUE(empty->populations.empty());
	EXPECT_TRUE(empty->projections.empty());
	EXPECT_NE(*empty, *network);
}

TEST(NetworkBuilder, Invalid)
{
	NetworkBuilder builder;

	EXPECT_THROW(builder.add(Population("A", 0, iaf_properties())), std::runtime_error);
	auto invalid_cell = iaf_properties();
	invalid_cell.dynamics.parameters.push_back(Parameter{"v"});
	EXPECT_THROW(builder.add(Population("A", 10, invalid_cell)), std::runtime_error);

	builder.add(Population("A", 10, iaf_properties()));
	EXPECT_THROW(builder.add(Population("A", 5, iaf_properties())), sinter::NameCollisionError);

	EXPECT_THROW(builder.add(Selection{"S", {}}), sinter::StructuralError);
	EXPECT_THROW(builder.add(Selection{"S", {"A", "B"}}), sinter::StructuralError);
	EXPECT_THROW(builder.add(Selection{"A", {"A"}}), sinter::NameCollisionError);

	auto const response = exponential_synapse_properties(SingleValue(1.));
	EXPECT_THROW(builder.add(make_projection("P", "A", "B", response)), sinter::StructuralError);
	EXPECT_THROW(builder.add(make_projection("A", "A", "A", response)), sinter::NameCollisionError);

	// plasticity role without plasticity dynamics
	auto projection = make_projection("P", "A", "A", response);
	projection.port_connections.push_back(PortConnection{
	    Role::pre, Role::plasticity, "spike", "spike", Communication::event});
	EXPECT_THROW(builder.add(projection), sinter::InvalidRoleError);

	// synapse role is reserved for flattening
	auto synapse_projection = make_projection("P", "A", "A", response);
	synapse_projection.port_connections.push_back(
	    PortConnection{Role::synapse, Role::post, "i", "isyn", Communication::analog});
	EXPECT_THROW(builder.add(synapse_projection), sinter::InvalidRoleError);

	EXPECT_NO_THROW(builder.add(make_projection("P", "A", "A", response)));
	EXPECT_TRUE(builder.done()->projections.contains("P"));
}
