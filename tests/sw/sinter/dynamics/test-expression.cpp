#include "sinter/dynamics/expression.h"

#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>

using namespace sinter::dynamics;

TEST(Expression, General)
{
	auto const g = Expression::symbol("g");
	auto const tau = Expression::symbol("tau");

	Expression const constant(2.5);
	EXPECT_EQ(constant.get_operator(), Expression::Operator::constant);
	EXPECT_EQ(constant.get_value(), 2.5);
	EXPECT_THROW(constant.get_name(), std::logic_error);
	EXPECT_THROW(g.get_value(), std::logic_error);
	EXPECT_EQ(g.get_name(), "g");

	auto const rhs = -g / tau;
	EXPECT_EQ(rhs.get_operator(), Expression::Operator::divide);
	EXPECT_EQ(rhs.get_operands().size(), 2);
	EXPECT_EQ(rhs.get_symbols(), (std::set<std::string>{"g", "tau"}));

	EXPECT_EQ(rhs, -g / tau);
	EXPECT_NE(rhs, g / tau);
	EXPECT_NE(Expression(1.), Expression(2.));

	std::stringstream ss;
	ss << (g + 1.);
	EXPECT_EQ(ss.str(), "(g + 1)");

	EXPECT_THROW(
	    Expression::binary(Expression::Operator::negate, g, tau), std::invalid_argument);
	EXPECT_THROW(Expression::unary(Expression::Operator::add, g), std::invalid_argument);
}

TEST(Expression, SubstituteRename)
{
	auto const g = Expression::symbol("g");
	auto const tau = Expression::symbol("tau");
	auto const weight = Expression::symbol("weight");

	auto const expression = g + weight * tau;

	EXPECT_EQ(
	    expression.substitute({{"weight", Expression(2.)}}), g + Expression(2.) * tau);
	EXPECT_EQ(expression.substitute({}), expression);
	EXPECT_EQ(expression.substitute({{"g", g + tau}}).get_symbols(), expression.get_symbols());

	auto const renamed = expression.rename({{"g", "g__psr"}, {"tau", "tau__psr"}});
	EXPECT_EQ(
	    renamed.get_symbols(), (std::set<std::string>{"g__psr", "tau__psr", "weight"}));
	EXPECT_EQ(
	    renamed,
	    Expression::symbol("g__psr") + weight * Expression::symbol("tau__psr"));

	auto const call = Expression::function("exp", g);
	EXPECT_EQ(call.rename({{"g", "x"}}), Expression::function("exp", Expression::symbol("x")));
}

TEST(Expression, Linearity)
{
	auto const g = Expression::symbol("g");
	auto const h = Expression::symbol("h");
	auto const tau = Expression::symbol("tau");
	std::set<std::string> const state{"g", "h"};

	EXPECT_EQ(Expression(1.).get_degree_in(state), 0);
	EXPECT_EQ(tau.get_degree_in(state), 0);
	EXPECT_EQ(g.get_degree_in(state), 1);
	EXPECT_EQ((g * h).get_degree_in(state), 2);
	EXPECT_EQ((g * g * g).get_degree_in(state), 3);
	EXPECT_EQ(Expression::binary(Expression::Operator::power, g, Expression(2.)).get_degree_in(state), 2);

	EXPECT_TRUE((-g / tau).is_linear_in(state));
	EXPECT_TRUE((g * tau + h - 3.).is_linear_in(state));
	EXPECT_TRUE(Expression::function("exp", tau).is_linear_in(state));
	EXPECT_TRUE((g * h).is_linear_in({"g"}));

	EXPECT_FALSE((g * h).is_linear_in(state));
	EXPECT_FALSE((g * g / tau).is_linear_in(state));
	EXPECT_FALSE((tau / g).is_linear_in(state));
	EXPECT_FALSE(Expression::function("exp", g).is_linear_in(state));
	EXPECT_FALSE(
	    Expression::binary(Expression::Operator::greater, g, tau).is_linear_in(state));
}
