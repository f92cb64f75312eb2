#include "sinter/test_helper/models.h"

namespace sinter::test_helper {

using namespace sinter::dynamics;

Dynamics iaf_dynamics()
{
	auto const v = Expression::symbol("v");
	Dynamics dynamics{"iaf"};
	dynamics.parameters = {{"tau_m", "time"}, {"v_thresh", "voltage"}, {"v_reset", "voltage"}};
	dynamics.state_variables = {{"v", "voltage"}};
	dynamics.ports = {
	    Port("v", Port::Mode::send, Communication::analog, "voltage"),
	    Port("spike", Port::Mode::send, Communication::event),
	    Port("isyn", Port::Mode::reduce, Communication::analog, "current"),
	    Port("feedback", Port::Mode::receive, Communication::event)};
	dynamics.regimes = {Regime{
	    "subthreshold",
	    {TimeDerivative{"v", (Expression::symbol("isyn") - v) / Expression::symbol("tau_m")}},
	    {OnEvent{"feedback"}},
	    {OnCondition{
	        Expression::binary(Expression::Operator::greater, v, Expression::symbol("v_thresh")),
	        {StateAssignment{"v", Expression::symbol("v_reset")}},
	        {"spike"}}}}};
	return dynamics;
}

DynamicsProperties iaf_properties()
{
	return DynamicsProperties(
	    "iaf_properties", iaf_dynamics(),
	    {{"tau_m", Quantity(SingleValue(20.), "ms")},
	     {"v_thresh", Quantity(SingleValue(-50.), "mV")},
	     {"v_reset", Quantity(SingleValue(-65.), "mV")}},
	    {{"v", Quantity(SingleValue(-65.), "mV")}});
}

namespace {

Dynamics synapse_dynamics(std::string const& name, Expression const& time_derivative)
{
	Dynamics dynamics{name};
	dynamics.parameters = {{"tau", "time"}, {"weight", "current"}};
	dynamics.state_variables = {{"g", "current"}};
	dynamics.aliases = {{"i", Expression::symbol("g")}};
	dynamics.ports = {
	    Port("spike", Port::Mode::receive, Communication::event),
	    Port("i", Port::Mode::send, Communication::analog, "current"),
	    Port("feedback", Port::Mode::send, Communication::event)};
	dynamics.regimes = {Regime{
	    "default",
	    {TimeDerivative{"g", time_derivative}},
	    {OnEvent{
	        "spike",
	        {StateAssignment{"g", Expression::symbol("g") + Expression::symbol("weight")}},
	        {"feedback"}}},
	    {}}};
	return dynamics;
}

DynamicsProperties synapse_properties(Dynamics const& dynamics, Value const& weight)
{
	return DynamicsProperties(
	    dynamics.name + "_properties", dynamics,
	    {{"tau", Quantity(SingleValue(5.), "ms")}, {"weight", Quantity(weight, "nA")}},
	    {{"g", Quantity(SingleValue(0.), "nA")}});
}

} // namespace

Dynamics exponential_synapse_dynamics()
{
	return synapse_dynamics(
	    "exponential_synapse", -Expression::symbol("g") / Expression::symbol("tau"));
}

DynamicsProperties exponential_synapse_properties(Value const& weight)
{
	return synapse_properties(exponential_synapse_dynamics(), weight);
}

Dynamics quadratic_synapse_dynamics()
{
	auto const g = Expression::symbol("g");
	return synapse_dynamics("quadratic_synapse", -(g * g) / Expression::symbol("tau"));
}

DynamicsProperties quadratic_synapse_properties(Value const& weight)
{
	return synapse_properties(quadratic_synapse_dynamics(), weight);
}

Dynamics driven_synapse_dynamics()
{
	return synapse_dynamics(
	    "driven_synapse",
	    (Expression::symbol("weight") - Expression::symbol("g")) / Expression::symbol("tau"));
}

DynamicsProperties driven_synapse_properties(Value const& weight)
{
	return synapse_properties(driven_synapse_dynamics(), weight);
}

network::Projection make_projection(
    std::string const& name,
    std::string const& pre,
    std::string const& post,
    DynamicsProperties const& response,
    network::ConnectivityRule const& connectivity,
    bool const with_feedback)
{
	using network::PortConnection;
	using network::Role;
	std::vector<PortConnection> port_connections{
	    PortConnection{Role::pre, Role::response, "spike", "spike", Communication::event},
	    PortConnection{Role::response, Role::post, "i", "isyn", Communication::analog}};
	if (with_feedback) {
		port_connections.push_back(
		    PortConnection{Role::response, Role::pre, "feedback", "feedback", Communication::event});
	}
	return network::Projection(
	    name, pre, post, connectivity, Quantity(SingleValue(2.), "ms"), response, std::nullopt,
	    port_connections);
}

} // namespace sinter::test_helper
