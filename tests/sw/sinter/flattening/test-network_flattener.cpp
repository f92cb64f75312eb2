#include "sinter/flattening/network_flattener.h"

#include "sinter/exception.h"
#include "sinter/network/network_builder.h"
#include "sinter/test_helper/models.h"
#include "logging_ctrl.h"
#include <gtest/gtest.h>
#include <log4cxx/level.h>

using namespace sinter::flattening;
using namespace sinter::dynamics;
using namespace sinter::network;
using namespace sinter::test_helper;

namespace {

ArrayValue const weights({0.1, 0.2, 0.3, 0.4, 0.5});

/** A(10) projecting onto B(5) via P with feedback from the synapse back to A. */
std::shared_ptr<Network> make_feedback_network(
    DynamicsProperties const& response, ConnectivityRule const& connectivity)
{
	NetworkBuilder builder;
	builder.add(Population("A", 10, iaf_properties()));
	builder.add(Population("B", 5, iaf_properties()));
	builder.add(make_projection("P", "A", "B", response, connectivity, true));
	return builder.done();
}

ConnectionGroup const& get_group(FlatteningResult const& result, std::string const& name)
{
	return result.connection_groups.get(name);
}

} // namespace

TEST(NetworkFlattener, EmbeddedSynapse)
{
	logger_default_config(log4cxx::Level::getWarn());

	FixedProbability const connectivity(0.1);
	auto const network =
	    make_feedback_network(exponential_synapse_properties(weights), connectivity);
	auto const result = flatten_network(*network);

	EXPECT_EQ(result.component_arrays.size(), 2);
	ASSERT_EQ(result.connection_groups.size(), 2);

	auto const& forward = get_group(result, "P__pre__spike__synapse__spike__psr");
	EXPECT_EQ(forward.get_communication(), Communication::event);
	EXPECT_EQ(forward.source, "A");
	EXPECT_EQ(forward.destination, "B");
	EXPECT_EQ(forward.source_port, "spike__cell");
	EXPECT_EQ(forward.destination_port, "spike__psr__P");
	EXPECT_EQ(*forward.connectivity, connectivity);
	EXPECT_EQ(forward.delay, Quantity(SingleValue(2.), "ms"));

	auto const& reverse = get_group(result, "P__synapse__feedback__psr__pre__feedback");
	EXPECT_EQ(reverse.get_communication(), Communication::event);
	EXPECT_EQ(reverse.source, "B");
	EXPECT_EQ(reverse.destination, "A");
	EXPECT_EQ(reverse.source_port, "feedback__psr__P");
	EXPECT_EQ(reverse.destination_port, "feedback__cell");
	EXPECT_EQ(*reverse.connectivity, *connectivity.inverse());
	EXPECT_EQ(reverse.delay, Quantity(SingleValue(0.), "ms"));

	auto const& b = result.component_arrays.get("B");
	EXPECT_EQ(b.name, "B");
	EXPECT_EQ(b.size, 5);
	EXPECT_TRUE(b.synapses.empty());
	EXPECT_EQ(b.component.get_sub_components().size(), 2);
	EXPECT_TRUE(b.component.get_sub_components().contains("P"));
	EXPECT_EQ(
	    b.component.get_internal_connections(),
	    std::set<InternalConnection>{InternalConnection({"P", "i__psr", "cell", "isyn"})});
	EXPECT_EQ(
	    b.component.get_exposures(),
	    (std::set<Exposure>{Exposure{"P", "feedback__psr"}, Exposure{"P", "spike__psr"}}));
	ASSERT_EQ(b.connection_property_sets.size(), 1);
	auto const& connection_property_set = b.get_connection_property_set("spike__psr__P");
	EXPECT_EQ(
	    connection_property_set.properties,
	    (std::map<std::string, Quantity>{{"weight__psr__P", Quantity(weights, "nA")}}));
	EXPECT_THROW(b.get_connection_property_set("spike__cell"), std::out_of_range);
	EXPECT_THROW(b.get_synapse("P"), std::out_of_range);

	auto const b_dynamics = b.component.get_dynamics();
	EXPECT_TRUE(b_dynamics.valid());
	EXPECT_TRUE(b_dynamics.has_port(forward.destination_port));
	EXPECT_TRUE(b_dynamics.has_port(reverse.source_port));

	auto const& a = result.component_arrays.get("A");
	EXPECT_EQ(a.size, 10);
	EXPECT_EQ(a.component.get_sub_components().size(), 1);
	EXPECT_EQ(
	    a.component.get_exposures(),
	    (std::set<Exposure>{Exposure{"cell", "feedback"}, Exposure{"cell", "spike"}}));
	EXPECT_TRUE(a.connection_property_sets.empty());

	auto const a_dynamics = a.component.get_dynamics();
	EXPECT_TRUE(a_dynamics.has_port(forward.source_port));
	EXPECT_TRUE(a_dynamics.has_port(reverse.destination_port));
}

TEST(NetworkFlattener, NonlinearSynapse)
{
	auto const network =
	    make_feedback_network(quadratic_synapse_properties(weights), AllToAll());
	auto const result = flatten_network(*network);

	auto const& b = result.component_arrays.get("B");
	EXPECT_EQ(b.component.get_sub_components().size(), 1);
	EXPECT_TRUE(b.component.get_internal_connections().empty());
	EXPECT_EQ(b.component.get_exposures(), std::set<Exposure>{Exposure({"cell", "isyn"})});
	EXPECT_TRUE(b.connection_property_sets.empty());

	ASSERT_EQ(b.synapses.size(), 1);
	auto const& synapse = b.get_synapse("P");
	EXPECT_EQ(synapse.synapse.get_name(), "P_syn");
	EXPECT_EQ(
	    synapse.port_connections,
	    std::vector<PortConnection>{
	        PortConnection{Role::synapse, Role::post, "i__psr", "isyn", Communication::analog}});

	// per-connection synapses are addressed by their unnamespaced ports
	auto const& forward = get_group(result, "P__pre__spike__synapse__spike__psr");
	EXPECT_EQ(forward.destination_port, "spike__psr");
	auto const& reverse = get_group(result, "P__synapse__feedback__psr__pre__feedback");
	EXPECT_EQ(reverse.source_port, "feedback__psr");
	EXPECT_EQ(*reverse.connectivity, AllToAll());
}

TEST(NetworkFlattener, VaryingPropertyInContinuousDynamics)
{
	NetworkBuilder builder;
	builder.add(Population("A", 10, iaf_properties()));
	builder.add(Population("B", 5, iaf_properties()));
	builder.add(make_projection("P", "A", "B", driven_synapse_properties(weights)));
	auto const result = flatten_network(*builder.done());

	auto const& b = result.component_arrays.get("B");
	EXPECT_EQ(b.synapses.size(), 1);
	EXPECT_TRUE(b.connection_property_sets.empty());
	EXPECT_FALSE(b.component.get_sub_components().contains("P"));

	// shared weight is embedded
	builder.add(Population("A", 10, iaf_properties()));
	builder.add(Population("B", 5, iaf_properties()));
	builder.add(make_projection("P", "A", "B", driven_synapse_properties(SingleValue(1.))));
	auto const embedded = flatten_network(*builder.done());
	EXPECT_TRUE(embedded.component_arrays.get("B").synapses.empty());
	EXPECT_TRUE(
	    embedded.component_arrays.get("B").component.get_sub_components().contains("P"));
}

TEST(NetworkFlattener, Selection)
{
	NetworkBuilder builder;
	builder.add(Population("A", 10, iaf_properties()));
	builder.add(Population("B", 5, iaf_properties()));
	builder.add(Population("C", 3, iaf_properties()));
	builder.add(Selection{"S", {"B", "C"}});
	builder.add(make_projection("P", "A", "S", exponential_synapse_properties(SingleValue(1.))));
	auto const result = flatten_network(*builder.done());

	EXPECT_EQ(result.component_arrays.size(), 3);
	ASSERT_EQ(result.connection_groups.size(), 2);
	auto const& to_b = get_group(result, "P__B__pre__spike__synapse__spike__psr");
	EXPECT_EQ(to_b.source, "A");
	EXPECT_EQ(to_b.destination, "B");
	auto const& to_c = get_group(result, "P__C__pre__spike__synapse__spike__psr");
	EXPECT_EQ(to_c.destination, "C");
	EXPECT_EQ(to_c.destination_port, "spike__psr__P");

	EXPECT_TRUE(result.component_arrays.get("B").component.get_sub_components().contains("P"));
	EXPECT_TRUE(result.component_arrays.get("C").component.get_sub_components().contains("P"));
}

TEST(NetworkFlattener, PreConnectionGroups)
{
	auto projection = make_projection(
	    "P", "A", "B", exponential_synapse_properties(SingleValue(1.)), OneToOne(), true);
	projection.port_connections.push_back(
	    PortConnection{Role::pre, Role::post, "spike", "feedback", Communication::event});
	// duplicate port connections result in a single connection group
	projection.port_connections.push_back(projection.port_connections.front());

	NetworkBuilder builder;
	builder.add(Population("A", 10, iaf_properties()));
	builder.add(Population("B", 10, iaf_properties()));
	builder.add(projection);
	auto const result = flatten_network(*builder.done());

	EXPECT_EQ(result.connection_groups.size(), 3);
	auto const& direct = get_group(result, "P__pre__spike__post__feedback");
	EXPECT_EQ(direct.source_port, "spike__cell");
	EXPECT_EQ(direct.destination_port, "feedback__cell");
	EXPECT_EQ(direct.source, "A");
	EXPECT_EQ(direct.destination, "B");
	EXPECT_TRUE(result.component_arrays.get("B").component.get_exposures().contains(
	    Exposure{"cell", "feedback"}));
}

TEST(NetworkFlattener, Deterministic)
{
	auto const build = [](bool reversed) {
		NetworkBuilder builder;
		std::vector<Population> populations{
		    Population("A", 10, iaf_properties()), Population("B", 5, iaf_properties()),
		    Population("C", 5, iaf_properties())};
		std::vector<Projection> projections{
		    make_projection("P1", "A", "C", exponential_synapse_properties(weights)),
		    make_projection("P2", "B", "C", quadratic_synapse_properties(SingleValue(1.))),
		    make_projection(
		        "P3", "C", "A", exponential_synapse_properties(SingleValue(1.)), AllToAll(), true)};
		if (reversed) {
			for (auto it = populations.rbegin(); it != populations.rend(); ++it) {
				builder.add(*it);
			}
			for (auto it = projections.rbegin(); it != projections.rend(); ++it) {
				builder.add(*it);
			}
		} else {
			for (auto const& population : populations) {
				builder.add(population);
			}
			for (auto const& projection : projections) {
				builder.add(projection);
			}
		}
		return builder.done();
	};

	auto const network = build(false);
	EXPECT_EQ(*network, *build(true));

	FlattenerConfig sequential_config;
	sequential_config.enable_parallel = false;
	auto const parallel = NetworkFlattener().flatten(*network);
	auto const sequential = NetworkFlattener(sequential_config).flatten(*network);
	EXPECT_EQ(parallel, sequential);
	EXPECT_EQ(flatten_network(*build(true)), parallel);
	EXPECT_EQ(NetworkFlattener().flatten(*network), parallel);

	auto const& c = parallel.component_arrays.get("C");
	EXPECT_TRUE(c.component.get_sub_components().contains("P1"));
	EXPECT_FALSE(c.component.get_sub_components().contains("P2"));
	EXPECT_EQ(c.synapses.size(), 1);
	EXPECT_EQ(parallel.connection_groups.size(), 4);
}

TEST(NetworkFlattener, FlattenPopulation)
{
	auto const network =
	    make_feedback_network(exponential_synapse_properties(weights), AllToAll());
	NetworkFlattener const flattener;

	auto const b = flattener.flatten_population(*network, "B");
	EXPECT_EQ(b.component_arrays.size(), 1);
	EXPECT_EQ(b.connection_groups.size(), 2);

	// the sending population's result contains no connection groups
	auto a = flattener.flatten_population(*network, "A");
	EXPECT_EQ(a.component_arrays.size(), 1);
	EXPECT_TRUE(a.connection_groups.empty());

	auto merged = flattener.flatten_population(*network, "B");
	merged.merge(std::move(a));
	EXPECT_EQ(merged, flattener.flatten(*network));

	auto colliding = flattener.flatten_population(*network, "B");
	EXPECT_THROW(merged.merge(std::move(colliding)), sinter::NameCollisionError);
}

TEST(NetworkFlattener, Config)
{
	FlattenerConfig config;
	config.cell_role_name = "soma";
	config.response_role_name = "response";
	EXPECT_NE(config, FlattenerConfig());

	auto const network =
	    make_feedback_network(exponential_synapse_properties(SingleValue(1.)), AllToAll());
	NetworkFlattener const flattener(config);
	EXPECT_EQ(flattener.get_config(), config);
	auto const result = flattener.flatten(*network);

	auto const& forward = get_group(result, "P__pre__spike__synapse__spike__response");
	EXPECT_EQ(forward.source_port, "spike__soma");
	EXPECT_EQ(forward.destination_port, "spike__response__P");
	EXPECT_TRUE(result.component_arrays.get("B").component.get_sub_components().contains("soma"));
}

TEST(NetworkFlattener, Invalid)
{
	auto const response = exponential_synapse_properties(SingleValue(1.));
	NetworkFlattener const flattener;

	{
		// population named like a projection
		Network const network{
		    {{"A", Population("A", 10, iaf_properties())},
		     {"P", Population("P", 10, iaf_properties())}},
		    {},
		    {{"P", make_projection("P", "A", "A", response)}},
		    std::chrono::microseconds(0)};
		EXPECT_THROW(flattener.flatten(network), sinter::StructuralError);
		EXPECT_THROW(flattener.validate(network), sinter::NameCollisionError);
	}
	{
		NetworkBuilder builder;
		builder.add(Population("cell", 10, iaf_properties()));
		EXPECT_THROW(flattener.flatten(*builder.done()), sinter::ReservedNameError);
	}
	{
		NetworkBuilder builder;
		builder.add(Population("A", 10, iaf_properties()));
		builder.add(make_projection("cell", "A", "A", response));
		EXPECT_THROW(flattener.flatten(*builder.done()), sinter::ReservedNameError);
	}
	{
		Network const network{
		    {{"A", Population("A", 10, iaf_properties())}},
		    {},
		    {{"P", make_projection("P", "A", "B", response)}},
		    std::chrono::microseconds(0)};
		EXPECT_THROW(flattener.flatten(network), sinter::StructuralError);
	}
	{
		Network const network{
		    {{"A", Population("B", 10, iaf_properties())}},
		    {},
		    {},
		    std::chrono::microseconds(0)};
		EXPECT_THROW(flattener.validate(network), sinter::StructuralError);
	}
	{
		// analog receive port of the cell left unconnected
		auto cell = iaf_properties();
		cell.dynamics.ports.push_back(Port("input", Port::Mode::receive, Communication::analog));
		NetworkBuilder builder;
		builder.add(Population("A", 10, cell));
		EXPECT_THROW(flattener.flatten(*builder.done()), sinter::StructuralError);
	}
}
