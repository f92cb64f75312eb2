#include "sinter/dynamics/dynamics.h"

#include "sinter/exception.h"
#include "hate/indent.h"
#include "hate/join.h"
#include <algorithm>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace sinter::dynamics {

std::ostream& operator<<(std::ostream& os, Communication const communication)
{
	switch (communication) {
		case Communication::event:
			return os << "event";
		case Communication::analog:
			return os << "analog";
	}
	throw std::logic_error("Unknown communication.");
}

std::ostream& operator<<(std::ostream& os, Port::Mode const mode)
{
	switch (mode) {
		case Port::Mode::send:
			return os << "send";
		case Port::Mode::receive:
			return os << "receive";
		case Port::Mode::reduce:
			return os << "reduce";
	}
	throw std::logic_error("Unknown port mode.");
}

Port::Port(std::string name, Mode mode, Communication communication, std::string dimension) :
    name(std::move(name)),
    mode(mode),
    communication(communication),
    dimension(std::move(dimension))
{}

std::ostream& operator<<(std::ostream& os, Port const& port)
{
	return os << "Port(" << port.name << ", " << port.communication << " " << port.mode << ", "
	          << port.dimension << ")";
}


bool Dynamics::has_parameter(std::string const& name) const
{
	return std::any_of(parameters.begin(), parameters.end(), [name](auto const& parameter) {
		return parameter.name == name;
	});
}

bool Dynamics::has_state_variable(std::string const& name) const
{
	return std::any_of(
	    state_variables.begin(), state_variables.end(),
	    [name](auto const& state_variable) { return state_variable.name == name; });
}

bool Dynamics::has_alias(std::string const& name) const
{
	return std::any_of(
	    aliases.begin(), aliases.end(), [name](auto const& alias) { return alias.name == name; });
}

bool Dynamics::has_port(std::string const& name) const
{
	return std::any_of(
	    ports.begin(), ports.end(), [name](auto const& port) { return port.name == name; });
}

Port const& Dynamics::get_port(std::string const& name) const
{
	auto const it =
	    std::find_if(ports.begin(), ports.end(), [name](auto const& port) { return port.name == name; });
	if (it == ports.end()) {
		throw std::out_of_range("Dynamics(" + this->name + ") doesn't feature port(" + name + ").");
	}
	return *it;
}

std::set<std::string> Dynamics::get_state_variable_names() const
{
	std::set<std::string> names;
	for (auto const& state_variable : state_variables) {
		names.insert(state_variable.name);
	}
	return names;
}

std::vector<TimeDerivative> Dynamics::get_time_derivatives() const
{
	std::vector<TimeDerivative> time_derivatives;
	for (auto const& regime : regimes) {
		time_derivatives.insert(
		    time_derivatives.end(), regime.time_derivatives.begin(), regime.time_derivatives.end());
	}
	return time_derivatives;
}

std::vector<OnEvent> Dynamics::get_on_events() const
{
	std::vector<OnEvent> on_events;
	for (auto const& regime : regimes) {
		on_events.insert(on_events.end(), regime.on_events.begin(), regime.on_events.end());
	}
	return on_events;
}

std::vector<OnCondition> Dynamics::get_on_conditions() const
{
	std::vector<OnCondition> on_conditions;
	for (auto const& regime : regimes) {
		on_conditions.insert(
		    on_conditions.end(), regime.on_conditions.begin(), regime.on_conditions.end());
	}
	return on_conditions;
}

Expression Dynamics::expand_aliases(Expression const& expression) const
{
	std::map<std::string, Expression> definitions;
	for (auto const& alias : aliases) {
		definitions.emplace(alias.name, alias.rhs);
	}
	auto const references_alias = [&definitions](Expression const& e) {
		auto const symbols = e.get_symbols();
		return std::any_of(symbols.begin(), symbols.end(), [&definitions](auto const& symbol) {
			return definitions.contains(symbol);
		});
	};
	auto expanded = expression;
	// every substitution pass resolves at least one level of alias nesting
	for (size_t i = 0; i <= aliases.size(); ++i) {
		if (!references_alias(expanded)) {
			return expanded;
		}
		expanded = expanded.substitute(definitions);
	}
	throw StructuralError("Dynamics(" + name + ") features cyclic alias definitions.");
}

RequiredDefinitions Dynamics::required_for(std::vector<Expression> const& expressions) const
{
	RequiredDefinitions required;
	std::vector<std::string> pending;
	for (auto const& expression : expressions) {
		auto const symbols = expression.get_symbols();
		pending.insert(pending.end(), symbols.begin(), symbols.end());
	}
	while (!pending.empty()) {
		auto const symbol = pending.back();
		pending.pop_back();
		if (has_parameter(symbol)) {
			required.parameters.insert(symbol);
		} else if (has_state_variable(symbol)) {
			required.state_variables.insert(symbol);
		} else if (has_port(symbol)) {
			required.ports.insert(symbol);
		} else if (has_alias(symbol) && !required.aliases.contains(symbol)) {
			required.aliases.insert(symbol);
			auto const& alias = *std::find_if(
			    aliases.begin(), aliases.end(),
			    [symbol](auto const& alias) { return alias.name == symbol; });
			auto const symbols = alias.rhs.get_symbols();
			pending.insert(pending.end(), symbols.begin(), symbols.end());
		}
	}
	return required;
}

std::optional<std::string> Dynamics::get_nonlinearity() const
{
	if (regimes.size() > 1) {
		return "Dynamics(" + name + ") features " + std::to_string(regimes.size()) + " regimes.";
	}
	auto const state_variable_names = get_state_variable_names();
	for (auto const& regime : regimes) {
		if (!regime.on_conditions.empty()) {
			return "Dynamics(" + name + ") features on-conditions in regime(" + regime.name + ").";
		}
		for (auto const& time_derivative : regime.time_derivatives) {
			if (!expand_aliases(time_derivative.rhs).is_linear_in(state_variable_names)) {
				std::stringstream ss;
				ss << "Time derivative of " << time_derivative.variable << " in dynamics(" << name
				   << ") is not linear in state variables: " << time_derivative.rhs << ".";
				return ss.str();
			}
		}
		for (auto const& on_event : regime.on_events) {
			for (auto const& state_assignment : on_event.state_assignments) {
				if (!expand_aliases(state_assignment.rhs).is_linear_in(state_variable_names)) {
					std::stringstream ss;
					ss << "Assignment to " << state_assignment.variable << " on event("
					   << on_event.src_port << ") in dynamics(" << name
					   << ") is not linear in state variables: " << state_assignment.rhs << ".";
					return ss.str();
				}
			}
		}
	}
	return std::nullopt;
}

bool Dynamics::is_linear() const
{
	return !get_nonlinearity();
}

bool Dynamics::valid() const
{
	std::set<std::string> names;
	auto const insert_unique = [&names](std::string const& name) {
		return names.insert(name).second;
	};
	for (auto const& parameter : parameters) {
		if (!insert_unique(parameter.name)) {
			return false;
		}
	}
	for (auto const& state_variable : state_variables) {
		if (!insert_unique(state_variable.name)) {
			return false;
		}
	}
	for (auto const& alias : aliases) {
		if (!insert_unique(alias.name)) {
			return false;
		}
	}
	std::set<std::string> port_names;
	for (auto const& port : ports) {
		if (!port_names.insert(port.name).second) {
			return false;
		}
		if (port.mode == Port::Mode::send) {
			// analog send ports expose a state variable or alias of the same name
			if (port.communication == Communication::analog &&
			    !(has_state_variable(port.name) || has_alias(port.name))) {
				return false;
			}
		} else {
			if (port.mode == Port::Mode::reduce && port.communication != Communication::analog) {
				return false;
			}
			if (port.communication == Communication::analog && !insert_unique(port.name)) {
				return false;
			}
		}
	}

	auto const is_defined = [&](Expression const& expression) {
		auto const symbols = expression.get_symbols();
		return std::all_of(symbols.begin(), symbols.end(), [&](auto const& symbol) {
			return names.contains(symbol);
		});
	};
	auto const is_event_port = [&](std::string const& name, Port::Mode mode) {
		return has_port(name) && get_port(name).communication == Communication::event &&
		       get_port(name).mode == mode;
	};
	std::set<std::string> regime_names;
	for (auto const& regime : regimes) {
		if (!regime_names.insert(regime.name).second) {
			return false;
		}
	}
	auto const is_valid_transition = [&](auto const& transition) {
		return std::all_of(
		           transition.state_assignments.begin(), transition.state_assignments.end(),
		           [&](auto const& assignment) {
			           return has_state_variable(assignment.variable) && is_defined(assignment.rhs);
		           }) &&
		       std::all_of(
		           transition.output_events.begin(), transition.output_events.end(),
		           [&](auto const& port) { return is_event_port(port, Port::Mode::send); }) &&
		       (!transition.target_regime || regime_names.contains(*transition.target_regime));
	};
	for (auto const& alias : aliases) {
		if (!is_defined(alias.rhs)) {
			return false;
		}
	}
	for (auto const& regime : regimes) {
		for (auto const& time_derivative : regime.time_derivatives) {
			if (!has_state_variable(time_derivative.variable) || !is_defined(time_derivative.rhs)) {
				return false;
			}
		}
		for (auto const& on_event : regime.on_events) {
			// internally connected event send ports trigger on-events of flattened dynamics
			if (!(is_event_port(on_event.src_port, Port::Mode::receive) ||
			      is_event_port(on_event.src_port, Port::Mode::send)) ||
			    !is_valid_transition(on_event)) {
				return false;
			}
		}
		for (auto const& on_condition : regime.on_conditions) {
			if (!is_defined(on_condition.trigger) || !is_valid_transition(on_condition)) {
				return false;
			}
		}
	}
	return true;
}

std::ostream& operator<<(std::ostream& os, Dynamics const& dynamics)
{
	hate::IndentingOstream ios(os);
	ios << "Dynamics(\n" << hate::Indentation("\t");
	ios << "name: " << dynamics.name << "\n";
	ios << "parameters: ";
	for (auto const& parameter : dynamics.parameters) {
		ios << parameter.name << " ";
	}
	ios << "\nstate variables: ";
	for (auto const& state_variable : dynamics.state_variables) {
		ios << state_variable.name << " ";
	}
	ios << "\nports:\n" << hate::Indentation("\t\t");
	for (auto const& port : dynamics.ports) {
		ios << port << "\n";
	}
	ios << hate::Indentation("\t") << "aliases:\n" << hate::Indentation("\t\t");
	for (auto const& alias : dynamics.aliases) {
		ios << alias.name << " := " << alias.rhs << "\n";
	}
	ios << hate::Indentation("\t") << "regimes:\n";
	for (auto const& regime : dynamics.regimes) {
		ios << hate::Indentation("\t\t") << regime.name << ":\n" << hate::Indentation("\t\t\t");
		for (auto const& time_derivative : regime.time_derivatives) {
			ios << "d" << time_derivative.variable << "/dt = " << time_derivative.rhs << "\n";
		}
		for (auto const& on_event : regime.on_events) {
			ios << "on " << on_event.src_port << ": ";
			for (auto const& assignment : on_event.state_assignments) {
				ios << assignment.variable << " = " << assignment.rhs << "; ";
			}
			ios << "emit [" << hate::join(on_event.output_events, ", ") << "]";
			if (on_event.target_regime) {
				ios << " -> " << *on_event.target_regime;
			}
			ios << "\n";
		}
		for (auto const& on_condition : regime.on_conditions) {
			ios << "on " << on_condition.trigger << ": ";
			for (auto const& assignment : on_condition.state_assignments) {
				ios << assignment.variable << " = " << assignment.rhs << "; ";
			}
			ios << "emit [" << hate::join(on_condition.output_events, ", ") << "]";
			if (on_condition.target_regime) {
				ios << " -> " << *on_condition.target_regime;
			}
			ios << "\n";
		}
	}
	ios << hate::Indentation() << ")";
	return os;
}

} // namespace sinter::dynamics
