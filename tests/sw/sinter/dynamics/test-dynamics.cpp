#include "sinter/dynamics/dynamics.h"

#include "sinter/exception.h"
#include "sinter/test_helper/models.h"
#include <stdexcept>
#include <gtest/gtest.h>

using namespace sinter::dynamics;
using namespace sinter::test_helper;

TEST(Dynamics, Valid)
{
	EXPECT_TRUE(iaf_dynamics().valid());
	EXPECT_TRUE(exponential_synapse_dynamics().valid());
	EXPECT_TRUE(quadratic_synapse_dynamics().valid());
	EXPECT_TRUE(driven_synapse_dynamics().valid());

	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.parameters.push_back(Parameter{"g"});
		EXPECT_FALSE(dynamics.valid());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.ports.push_back(Port("unknown", Port::Mode::send, Communication::analog));
		EXPECT_FALSE(dynamics.valid());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.ports.push_back(Port("input", Port::Mode::reduce, Communication::event));
		EXPECT_FALSE(dynamics.valid());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.regimes.at(0).time_derivatives.at(0).rhs = Expression::symbol("undefined");
		EXPECT_FALSE(dynamics.valid());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.regimes.at(0).on_events.at(0).output_events = {"spike"};
		EXPECT_FALSE(dynamics.valid());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.regimes.at(0).on_events.at(0).target_regime = "undefined";
		EXPECT_FALSE(dynamics.valid());
	}
	{
		// analog receive ports are usable as symbols
		auto dynamics = exponential_synapse_dynamics();
		dynamics.ports.push_back(Port("input", Port::Mode::receive, Communication::analog));
		dynamics.regimes.at(0).time_derivatives.at(0).rhs =
		    Expression::symbol("input") - Expression::symbol("g");
		EXPECT_TRUE(dynamics.valid());
	}
}

TEST(Dynamics, Lookup)
{
	auto const dynamics = exponential_synapse_dynamics();

	EXPECT_TRUE(dynamics.has_parameter("tau"));
	EXPECT_FALSE(dynamics.has_parameter("g"));
	EXPECT_TRUE(dynamics.has_state_variable("g"));
	EXPECT_TRUE(dynamics.has_alias("i"));
	EXPECT_TRUE(dynamics.has_port("spike"));

	EXPECT_EQ(dynamics.get_port("i").communication, Communication::analog);
	EXPECT_THROW(dynamics.get_port("undefined"), std::out_of_range);

	EXPECT_EQ(dynamics.get_state_variable_names(), std::set<std::string>{"g"});
	EXPECT_EQ(dynamics.get_time_derivatives().size(), 1);
	EXPECT_EQ(dynamics.get_on_events().size(), 1);
	EXPECT_TRUE(dynamics.get_on_conditions().empty());
}

TEST(Dynamics, RequiredFor)
{
	auto dynamics = exponential_synapse_dynamics();
	dynamics.aliases.push_back(
	    Alias{"scaled", Expression::symbol("i") * Expression::symbol("weight")});

	auto const required = dynamics.required_for({Expression::symbol("scaled")});
	EXPECT_EQ(required.aliases, (std::set<std::string>{"i", "scaled"}));
	EXPECT_EQ(required.state_variables, std::set<std::string>{"g"});
	EXPECT_EQ(required.parameters, std::set<std::string>{"weight"});
	EXPECT_TRUE(required.ports.empty());

	EXPECT_EQ(
	    dynamics.expand_aliases(Expression::symbol("scaled")),
	    Expression::symbol("g") * Expression::symbol("weight"));

	dynamics.aliases.push_back(Alias{"a", Expression::symbol("b")});
	dynamics.aliases.push_back(Alias{"b", Expression::symbol("a") + 1.});
	EXPECT_THROW(dynamics.expand_aliases(Expression::symbol("a")), sinter::StructuralError);
	// cyclic aliases don't hang the requirement search
	EXPECT_EQ(
	    dynamics.required_for({Expression::symbol("a")}).aliases,
	    (std::set<std::string>{"a", "b"}));
}

TEST(Dynamics, Linearity)
{
	EXPECT_TRUE(exponential_synapse_dynamics().is_linear());
	EXPECT_TRUE(driven_synapse_dynamics().is_linear());

	EXPECT_FALSE(quadratic_synapse_dynamics().is_linear());
	ASSERT_TRUE(quadratic_synapse_dynamics().get_nonlinearity());
	EXPECT_FALSE(quadratic_synapse_dynamics().get_nonlinearity()->empty());

	// on-conditions
	EXPECT_FALSE(iaf_dynamics().is_linear());

	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.regimes.push_back(Regime{"refractory"});
		EXPECT_FALSE(dynamics.is_linear());
	}
	{
		// nonlinearity hidden in alias
		auto dynamics = exponential_synapse_dynamics();
		dynamics.aliases.push_back(
		    Alias{"squared", Expression::symbol("g") * Expression::symbol("i")});
		dynamics.regimes.at(0).time_derivatives.at(0).rhs = -Expression::symbol("squared");
		EXPECT_TRUE(dynamics.valid());
		EXPECT_FALSE(dynamics.is_linear());
	}
	{
		auto dynamics = exponential_synapse_dynamics();
		dynamics.regimes.at(0).on_events.at(0).state_assignments.at(0).rhs =
		    Expression::symbol("g") * Expression::symbol("g");
		EXPECT_FALSE(dynamics.is_linear());
	}
}
