#include "sinter/dynamics/multi_component.h"

#include "sinter/common/namespace.h"
#include "sinter/exception.h"
#include "hate/indent.h"
#include "hate/join.h"
#include "hate/timer.h"
#include <algorithm>
#include <iterator>
#include <ostream>
#include <sstream>
#include <tuple>
#include <log4cxx/logger.h>

namespace sinter::dynamics {

using common::append_namespace;

bool InternalConnection::operator<(InternalConnection const& other) const
{
	return std::tie(sender, send_port, receiver, receive_port) <
	       std::tie(other.sender, other.send_port, other.receiver, other.receive_port);
}

std::ostream& operator<<(std::ostream& os, InternalConnection const& value)
{
	return os << "InternalConnection(" << value.sender << "." << value.send_port << " -> "
	          << value.receiver << "." << value.receive_port << ")";
}


std::string Exposure::get_name() const
{
	return append_namespace(port, component);
}

bool Exposure::operator<(Exposure const& other) const
{
	return std::tie(component, port) < std::tie(other.component, other.port);
}

std::ostream& operator<<(std::ostream& os, Exposure const& value)
{
	return os << "Exposure(" << value.component << "." << value.port << ")";
}


namespace {

/**
 * Per regime transformed transitions of one sub-component.
 * Target regimes still refer to the sub-component's own regime names.
 */
struct NamespacedRegime
{
	std::string name;
	std::vector<TimeDerivative> time_derivatives;
	std::vector<OnEvent> on_events;
	std::vector<OnCondition> on_conditions;
};

std::string combine_regime_names(std::vector<std::string> const& names)
{
	return hate::join_string(names, "___");
}

} // namespace

MultiComponent::MultiComponent(
    std::string name,
    SubComponents sub_components,
    std::set<InternalConnection> internal_connections,
    std::set<Exposure> exposures) :
    m_name(std::move(name)),
    m_sub_components(std::move(sub_components)),
    m_internal_connections(std::move(internal_connections)),
    m_exposures(std::move(exposures))
{
	std::map<std::string, Dynamics> dynamics;
	for (auto const& [sub_name, sub_component] : m_sub_components) {
		if (common::is_namespaced(sub_name)) {
			throw NamespaceCollisionError(
			    "Sub-component name(" + sub_name + ") of multi-component(" + m_name +
			    ") contains namespace separator.");
		}
		if (!sub_component) {
			throw StructuralError(
			    "Sub-component(" + sub_name + ") of multi-component(" + m_name + ") is not set.");
		}
		dynamics.emplace(sub_name, sub_component->get_dynamics());
	}

	auto const get_port = [&](std::string const& component, std::string const& port) {
		if (!dynamics.contains(component)) {
			throw StructuralError(
			    "Multi-component(" + m_name + ") doesn't feature sub-component(" + component +
			    ").");
		}
		if (!dynamics.at(component).has_port(port)) {
			throw StructuralError(
			    "Sub-component(" + component + ") of multi-component(" + m_name +
			    ") doesn't feature port(" + port + ").");
		}
		return dynamics.at(component).get_port(port);
	};

	for (auto const& connection : m_internal_connections) {
		auto const send_port = get_port(connection.sender, connection.send_port);
		auto const receive_port = get_port(connection.receiver, connection.receive_port);
		if (send_port.mode != Port::Mode::send || receive_port.mode == Port::Mode::send) {
			std::stringstream ss;
			ss << connection << " of multi-component(" << m_name
			   << ") doesn't connect a send port to a receive port.";
			throw StructuralError(ss.str());
		}
		if (send_port.communication != receive_port.communication) {
			std::stringstream ss;
			ss << connection << " of multi-component(" << m_name << ") connects "
			   << send_port.communication << " port to " << receive_port.communication
			   << " port.";
			throw StructuralError(ss.str());
		}
	}
	for (auto const& exposure : m_exposures) {
		// throws on dangling exposure
		static_cast<void>(get_port(exposure.component, exposure.port));
	}
}

MultiComponent::SubComponents const& MultiComponent::get_sub_components() const
{
	return m_sub_components;
}

std::set<InternalConnection> const& MultiComponent::get_internal_connections() const
{
	return m_internal_connections;
}

std::set<Exposure> const& MultiComponent::get_exposures() const
{
	return m_exposures;
}

std::string const& MultiComponent::get_name() const
{
	return m_name;
}

Dynamics MultiComponent::get_dynamics() const
{
	auto logger = log4cxx::Logger::getLogger("sinter.MultiComponent");
	hate::Timer timer;

	Dynamics flattened{m_name};
	std::set<std::string> names;
	std::set<std::string> port_names;
	auto const claim = [this](std::set<std::string>& claimed, std::string const& name) {
		if (!claimed.insert(name).second) {
			throw NamespaceCollisionError(
			    "Namespaced name(" + name + ") occurs more than once in multi-component(" +
			    m_name + ").");
		}
	};

	std::map<std::pair<std::string, std::string>, std::vector<InternalConnection>> incoming;
	std::set<std::pair<std::string, std::string>> internally_sending;
	for (auto const& connection : m_internal_connections) {
		incoming[{connection.receiver, connection.receive_port}].push_back(connection);
		internally_sending.insert({connection.sender, connection.send_port});
	}
	auto const is_exposed = [this](std::string const& component, std::string const& port) {
		return m_exposures.contains(Exposure{component, port});
	};

	std::vector<std::vector<NamespacedRegime>> sub_regimes;
	for (auto const& sub_component : m_sub_components) {
		auto const& sub_name = sub_component.first;
		auto const dynamics = sub_component.second->get_dynamics();
		auto const ns = [&sub_name](std::string const& name) {
			return append_namespace(name, sub_name);
		};

		std::map<std::string, Expression> replacements;
		for (auto const& parameter : dynamics.parameters) {
			claim(names, ns(parameter.name));
			flattened.parameters.push_back(Parameter{ns(parameter.name), parameter.dimension});
			replacements.emplace(parameter.name, Expression::symbol(ns(parameter.name)));
		}
		for (auto const& state_variable : dynamics.state_variables) {
			claim(names, ns(state_variable.name));
			flattened.state_variables.push_back(
			    StateVariable{ns(state_variable.name), state_variable.dimension});
			replacements.emplace(state_variable.name, Expression::symbol(ns(state_variable.name)));
		}
		for (auto const& alias : dynamics.aliases) {
			claim(names, ns(alias.name));
			replacements.emplace(alias.name, Expression::symbol(ns(alias.name)));
		}

		std::set<std::string> kept_ports;
		for (auto const& port : dynamics.ports) {
			bool const exposed = is_exposed(sub_name, port.name);
			if (exposed ||
			    (port.mode == Port::Mode::send && port.communication == Communication::event &&
			     internally_sending.contains({sub_name, port.name}))) {
				kept_ports.insert(port.name);
				claim(port_names, ns(port.name));
				flattened.ports.push_back(
				    Port(ns(port.name), port.mode, port.communication, port.dimension));
			}
			if (port.mode == Port::Mode::send || port.communication != Communication::analog) {
				continue;
			}
			std::vector<Expression> terms;
			if (incoming.contains({sub_name, port.name})) {
				for (auto const& connection : incoming.at({sub_name, port.name})) {
					terms.push_back(Expression::symbol(
					    append_namespace(connection.send_port, connection.sender)));
				}
			}
			if (exposed) {
				claim(names, ns(port.name));
				terms.push_back(Expression::symbol(ns(port.name)));
			}
			if (terms.size() > 1 && port.mode == Port::Mode::receive) {
				throw StructuralError(
				    "Analog receive port(" + port.name + ") of sub-component(" + sub_name +
				    ") in multi-component(" + m_name + ") is connected more than once.");
			}
			if (terms.empty()) {
				if (port.mode == Port::Mode::receive) {
					throw StructuralError(
					    "Analog receive port(" + port.name + ") of sub-component(" + sub_name +
					    ") in multi-component(" + m_name + ") is neither connected nor exposed.");
				}
				replacements.emplace(port.name, Expression(0.));
				continue;
			}
			auto sum = terms.front();
			for (auto it = std::next(terms.begin()); it != terms.end(); ++it) {
				sum = sum + *it;
			}
			replacements.emplace(port.name, sum);
		}

		for (auto const& alias : dynamics.aliases) {
			flattened.aliases.push_back(Alias{ns(alias.name), alias.rhs.substitute(replacements)});
		}

		auto const transform_assignments = [&](std::vector<StateAssignment> const& assignments) {
			std::vector<StateAssignment> transformed;
			for (auto const& assignment : assignments) {
				transformed.push_back(
				    StateAssignment{ns(assignment.variable), assignment.rhs.substitute(replacements)});
			}
			return transformed;
		};
		auto const transform_output_events = [&](std::vector<std::string> const& output_events) {
			std::vector<std::string> transformed;
			// events on ports neither exposed nor connected have no receiver
			for (auto const& output_event : output_events) {
				if (kept_ports.contains(output_event)) {
					transformed.push_back(ns(output_event));
				}
			}
			return transformed;
		};

		std::vector<NamespacedRegime> regimes;
		for (auto const& regime : dynamics.regimes) {
			NamespacedRegime namespaced{regime.name, {}, {}, {}};
			for (auto const& time_derivative : regime.time_derivatives) {
				namespaced.time_derivatives.push_back(TimeDerivative{
				    ns(time_derivative.variable), time_derivative.rhs.substitute(replacements)});
			}
			for (auto const& on_event : regime.on_events) {
				std::vector<std::string> sources;
				if (is_exposed(sub_name, on_event.src_port)) {
					sources.push_back(ns(on_event.src_port));
				}
				if (incoming.contains({sub_name, on_event.src_port})) {
					for (auto const& connection : incoming.at({sub_name, on_event.src_port})) {
						sources.push_back(append_namespace(connection.send_port, connection.sender));
					}
				}
				// on-events of unconnected event ports never trigger
				for (auto const& source : sources) {
					namespaced.on_events.push_back(OnEvent{
					    source, transform_assignments(on_event.state_assignments),
					    transform_output_events(on_event.output_events), on_event.target_regime});
				}
			}
			for (auto const& on_condition : regime.on_conditions) {
				namespaced.on_conditions.push_back(OnCondition{
				    on_condition.trigger.substitute(replacements),
				    transform_assignments(on_condition.state_assignments),
				    transform_output_events(on_condition.output_events),
				    on_condition.target_regime});
			}
			regimes.push_back(std::move(namespaced));
		}
		sub_regimes.push_back(std::move(regimes));
	}

	// regimes of the flattened dynamics are all combinations of sub-component regimes
	std::vector<std::vector<size_t>> combinations(1);
	for (auto const& regimes : sub_regimes) {
		if (regimes.empty()) {
			continue;
		}
		std::vector<std::vector<size_t>> extended;
		for (auto const& combination : combinations) {
			for (size_t i = 0; i < regimes.size(); ++i) {
				auto next = combination;
				next.push_back(i);
				extended.push_back(std::move(next));
			}
		}
		combinations = std::move(extended);
	}
	std::vector<std::vector<NamespacedRegime> const*> used_sub_regimes;
	for (auto const& regimes : sub_regimes) {
		if (!regimes.empty()) {
			used_sub_regimes.push_back(&regimes);
		}
	}
	auto const regime_name_of = [&](std::vector<size_t> const& combination) {
		std::vector<std::string> regime_names;
		for (size_t i = 0; i < combination.size(); ++i) {
			regime_names.push_back(used_sub_regimes.at(i)->at(combination.at(i)).name);
		}
		return combine_regime_names(regime_names);
	};
	auto const get_target = [&](std::vector<size_t> const& combination, size_t sub,
	                            std::optional<std::string> const& target)
	    -> std::optional<std::string> {
		if (!target) {
			return std::nullopt;
		}
		auto const& regimes = *used_sub_regimes.at(sub);
		auto const it = std::find_if(regimes.begin(), regimes.end(), [&target](auto const& regime) {
			return regime.name == *target;
		});
		if (it == regimes.end()) {
			throw StructuralError(
			    "Target regime(" + *target + ") in multi-component(" + m_name +
			    ") doesn't exist.");
		}
		auto next = combination;
		next.at(sub) = static_cast<size_t>(std::distance(regimes.begin(), it));
		return regime_name_of(next);
	};
	if (!used_sub_regimes.empty()) {
		for (auto const& combination : combinations) {
			Regime regime{regime_name_of(combination)};
			for (size_t sub = 0; sub < combination.size(); ++sub) {
				auto const& sub_regime = used_sub_regimes.at(sub)->at(combination.at(sub));
				regime.time_derivatives.insert(
				    regime.time_derivatives.end(), sub_regime.time_derivatives.begin(),
				    sub_regime.time_derivatives.end());
				for (auto on_event : sub_regime.on_events) {
					on_event.target_regime = get_target(combination, sub, on_event.target_regime);
					regime.on_events.push_back(std::move(on_event));
				}
				for (auto on_condition : sub_regime.on_conditions) {
					on_condition.target_regime =
					    get_target(combination, sub, on_condition.target_regime);
					regime.on_conditions.push_back(std::move(on_condition));
				}
			}
			flattened.regimes.push_back(std::move(regime));
		}
	}

	LOG4CXX_TRACE(
	    logger, "get_dynamics(): Flattened multi-component(" << m_name << ") with "
	                                                         << m_sub_components.size()
	                                                         << " sub-components in "
	                                                         << timer.print() << ".");
	return flattened;
}

std::map<std::string, Quantity> MultiComponent::get_properties() const
{
	std::map<std::string, Quantity> properties;
	for (auto const& [sub_name, sub_component] : m_sub_components) {
		for (auto const& [name, value] : sub_component->get_properties()) {
			properties.emplace(append_namespace(name, sub_name), value);
		}
	}
	return properties;
}

std::map<std::string, Quantity> MultiComponent::get_initial_values() const
{
	std::map<std::string, Quantity> initial_values;
	for (auto const& [sub_name, sub_component] : m_sub_components) {
		for (auto const& [name, value] : sub_component->get_initial_values()) {
			initial_values.emplace(append_namespace(name, sub_name), value);
		}
	}
	return initial_values;
}

std::unique_ptr<Component> MultiComponent::copy() const
{
	return std::make_unique<MultiComponent>(*this);
}

std::unique_ptr<Component> MultiComponent::move()
{
	return std::make_unique<MultiComponent>(std::move(*this));
}

std::ostream& MultiComponent::print(std::ostream& os) const
{
	hate::IndentingOstream ios(os);
	ios << "MultiComponent(\n" << hate::Indentation("\t");
	ios << "name: " << m_name << "\n";
	ios << "sub-components:\n" << hate::Indentation("\t\t");
	for (auto const& [sub_name, sub_component] : m_sub_components) {
		ios << sub_name << ": " << sub_component << "\n";
	}
	ios << hate::Indentation("\t") << "internal connections:\n" << hate::Indentation("\t\t");
	for (auto const& connection : m_internal_connections) {
		ios << connection << "\n";
	}
	ios << hate::Indentation("\t") << "exposures:\n" << hate::Indentation("\t\t");
	for (auto const& exposure : m_exposures) {
		ios << exposure << "\n";
	}
	ios << hate::Indentation() << ")";
	return os;
}

bool MultiComponent::is_equal_to(Component const& other) const
{
	auto const& other_multi_component = static_cast<MultiComponent const&>(other);
	return m_name == other_multi_component.m_name &&
	       m_sub_components == other_multi_component.m_sub_components &&
	       m_internal_connections == other_multi_component.m_internal_connections &&
	       m_exposures == other_multi_component.m_exposures;
}

} // namespace sinter::dynamics
