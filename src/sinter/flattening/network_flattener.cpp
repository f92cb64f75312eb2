#include "sinter/flattening/network_flattener.h"

#include "sinter/common/namespace.h"
#include "sinter/exception.h"
#include "sinter/flattening/connection_property_set.h"
#include "sinter/flattening/linearity_classifier.h"
#include "sinter/flattening/role_namespacer.h"
#include "sinter/flattening/synapse_flattener.h"
#include "hate/indent.h"
#include "hate/join.h"
#include "hate/timer.h"
#include "hate/variant.h"
#include <algorithm>
#include <mutex>
#include <set>
#include <sstream>
#include <log4cxx/logger.h>
#include <tbb/parallel_for_each.h>

namespace sinter::flattening {

using network::Role;

void FlatteningResult::merge(FlatteningResult&& other)
{
	for (auto const& [name, _] : other.connection_groups) {
		if (connection_groups.contains(name)) {
			throw NameCollisionError("Connection group(" + name + ") is present in both results.");
		}
	}
	component_arrays.merge(std::move(other.component_arrays));
	connection_groups.merge(std::move(other.connection_groups));
	duration += other.duration;
}

bool FlatteningResult::operator==(FlatteningResult const& other) const
{
	return component_arrays == other.component_arrays &&
	       connection_groups == other.connection_groups;
}

bool FlatteningResult::operator!=(FlatteningResult const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, FlatteningResult const& value)
{
	hate::IndentingOstream ios(os);
	ios << "FlatteningResult(\n" << hate::Indentation("\t");
	ios << "component arrays:\n" << hate::Indentation("\t\t");
	for (auto const& [name, component_array] : value.component_arrays) {
		ios << component_array << "\n";
	}
	ios << hate::Indentation("\t") << "connection groups:\n" << hate::Indentation("\t\t");
	for (auto const& [name, connection_group] : value.connection_groups) {
		ios << connection_group << "\n";
	}
	ios << hate::Indentation("\t") << "duration: " << value.duration.count() << " us";
	ios << hate::Indentation() << "\n)";
	return os;
}


NetworkFlattener::NetworkFlattener(FlattenerConfig config) :
    m_config(std::move(config)),
    m_logger(log4cxx::Logger::getLogger("sinter.flattening.NetworkFlattener"))
{}

FlattenerConfig const& NetworkFlattener::get_config() const
{
	return m_config;
}

void NetworkFlattener::validate(network::Network const& network) const
{
	hate::Timer timer;
	std::set<std::string> names;
	auto const check_name = [&](std::string const& key, std::string const& name,
	                            std::string const& kind) {
		if (key != name) {
			throw StructuralError(
			    kind + "(" + name + ") is stored under differing name(" + key + ").");
		}
		if (name == m_config.cell_role_name) {
			LOG4CXX_ERROR(
			    m_logger, "validate(): " << kind << "(" << name << ") uses reserved name.");
			throw ReservedNameError(
			    kind + "(" + name + ") uses name reserved for the cell dynamics.");
		}
		if (!names.insert(name).second) {
			LOG4CXX_ERROR(m_logger, "validate(): Name(" << name << ") used more than once.");
			throw NameCollisionError(
			    kind + "(" + name + ") uses name already used in the network.");
		}
	};
	for (auto const& [key, population] : network.populations) {
		check_name(key, population.name, "Population");
	}
	for (auto const& [key, selection] : network.selections) {
		check_name(key, selection.name, "Selection");
		for (auto const& population : selection.populations) {
			if (!network.populations.contains(population)) {
				throw StructuralError(
				    "Selection(" + selection.name + ") refers to unknown population(" +
				    population + ").");
			}
		}
	}
	for (auto const& [key, projection] : network.projections) {
		check_name(key, projection.name, "Projection");
		for (auto const& reference : {projection.pre, projection.post}) {
			if (!network.populations.contains(reference) &&
			    !network.selections.contains(reference)) {
				LOG4CXX_ERROR(
				    m_logger, "validate(): Projection(" << projection.name
				                                        << ") refers to unknown reference("
				                                        << reference << ").");
				throw StructuralError(
				    "Projection(" + projection.name +
				    ") refers to unknown population or selection(" + reference + ").");
			}
		}
	}
	LOG4CXX_TRACE(m_logger, "validate(): Validated network in " << timer.print() << ".");
}

FlatteningResult NetworkFlattener::flatten_population(
    network::Network const& network, std::string const& population_name) const
{
	hate::Timer timer;
	auto const& population = network.populations.at(population_name);
	auto const& cell_name = m_config.cell_role_name;

	auto const contains_population = [&](std::string const& reference) {
		auto const populations = network.resolve(reference);
		return std::find(populations.begin(), populations.end(), population_name) !=
		       populations.end();
	};
	std::vector<network::Projection const*> receiving;
	std::vector<network::Projection const*> sending;
	for (auto const& [name, projection] : network.projections) {
		if (contains_population(projection.post)) {
			receiving.push_back(&projection);
		}
		if (contains_population(projection.pre)) {
			sending.push_back(&projection);
		}
	}

	dynamics::MultiComponent::SubComponents sub_components{{cell_name, population.cell}};
	std::set<dynamics::InternalConnection> internal_connections;
	std::set<dynamics::Exposure> exposures;
	std::vector<SynapseProperties> synapses;
	std::vector<ConnectionPropertySet> connection_property_sets;
	FlatteningResult result;

	for (auto const* projection : receiving) {
		if (projection->name == cell_name) {
			LOG4CXX_ERROR(
			    m_logger, "flatten_population(): Projection(" << projection->name
			                                                  << ") uses reserved name.");
			throw ReservedNameError(
			    "Projection(" + projection->name + ") uses name reserved for the cell dynamics.");
		}

		auto flattened = flatten_synapse(*projection, m_config);

		std::vector<network::PortConnection> pre_connections;
		std::vector<network::PortConnection> post_connections;
		for (auto const& port_connection : flattened.port_connections) {
			if (port_connection.touches(Role::pre)) {
				if (std::find(pre_connections.begin(), pre_connections.end(), port_connection) ==
				    pre_connections.end()) {
					pre_connections.push_back(port_connection);
				}
			} else {
				post_connections.push_back(port_connection);
			}
		}

		auto classification = classify_linearity(flattened.synapse);
		if (std::holds_alternative<Embeddable>(classification)) {
			auto extraction = extract_connection_property_sets(flattened.synapse, projection->name);
			std::visit(
			    hate::overloaded{
			        [&](std::vector<ConnectionPropertySet>& sets) {
				        connection_property_sets.insert(
				            connection_property_sets.end(), std::make_move_iterator(sets.begin()),
				            std::make_move_iterator(sets.end()));
			        },
			        [&](Unflattenable& unflattenable) {
				        classification = std::move(unflattenable);
			        }},
			    extraction);
		}

		std::map<Role, std::string> names{{Role::post, cell_name}};
		std::visit(
		    hate::overloaded{
		        [&](Embeddable const&) {
			        LOG4CXX_DEBUG(
			            m_logger, "flatten_population(): Embedding synapse of projection("
			                          << projection->name << ") into population("
			                          << population_name << ").");
			        names.emplace(Role::synapse, projection->name);
			        RoleTable const roles(names, {Role::post, Role::synapse});
			        if (!sub_components.emplace(projection->name, flattened.synapse).second) {
				        throw NamespaceCollisionError(
				            "Synapse of projection(" + projection->name +
				            ") collides with other sub-component of population(" +
				            population_name + ").");
			        }
			        for (auto const& port_connection : post_connections) {
				        internal_connections.insert(roles.to_internal(port_connection));
			        }
		        },
		        [&](Unflattenable const& unflattenable) {
			        LOG4CXX_DEBUG(
			            m_logger, "flatten_population(): Instantiating synapse of projection("
			                          << projection->name << ") per connection: "
			                          << unflattenable.reason);
			        RoleTable const roles(names, {Role::post});
			        for (auto const& port_connection : post_connections) {
				        auto const port_exposures = roles.expose(port_connection);
				        exposures.insert(port_exposures.begin(), port_exposures.end());
			        }
			        synapses.push_back(
			            SynapseProperties{projection->name, flattened.synapse, post_connections});
		        }},
		    classification);

		{
			RoleTable const roles(names, {Role::post});
			for (auto const& port_connection : pre_connections) {
				auto const port_exposures = roles.expose(port_connection);
				exposures.insert(port_exposures.begin(), port_exposures.end());
			}
		}

		names.emplace(Role::pre, cell_name);
		// pre and post are cells of different component arrays and share the cell name
		auto const get_port_name = [&](std::string const& port, Role role) {
			if (!names.contains(role)) {
				return port;
			}
			return common::append_namespace(port, names.at(role));
		};
		bool const selection_target = network.is_selection(projection->post);
		for (auto const& port_connection : pre_connections) {
			std::stringstream ss;
			ss << projection->name << common::namespace_separator;
			if (selection_target) {
				ss << population_name << common::namespace_separator;
			}
			ss << port_connection.sender_role << common::namespace_separator
			   << port_connection.send_port << common::namespace_separator
			   << port_connection.receiver_role << common::namespace_separator
			   << port_connection.receive_port;
			auto const name = ss.str();

			auto const source_port =
			    get_port_name(port_connection.send_port, port_connection.sender_role);
			auto const destination_port =
			    get_port_name(port_connection.receive_port, port_connection.receiver_role);

			bool const forward = port_connection.sender_role == Role::pre;
			auto const source = forward ? projection->pre : population_name;
			auto const destination = forward ? population_name : projection->pre;
			common::PropertyHolder<network::ConnectivityRule> const connectivity =
			    forward ? common::PropertyHolder<network::ConnectivityRule>(*projection->connectivity)
			            : common::PropertyHolder<network::ConnectivityRule>(
			                  projection->connectivity->inverse());
			// reverse connections carry no delay
			auto const delay = forward ? projection->delay
			                           : dynamics::Quantity(
			                                 dynamics::SingleValue(0.), projection->delay.units);

			if (port_connection.communication == dynamics::Communication::event) {
				result.connection_groups.add(
				    name, EventConnectionGroup(
				              name, source, destination, source_port, destination_port,
				              *connectivity, delay));
			} else {
				result.connection_groups.add(
				    name, AnalogConnectionGroup(
				              name, source, destination, source_port, destination_port,
				              *connectivity, delay));
			}
			LOG4CXX_TRACE(
			    m_logger, "flatten_population(): Added connection group(" << name << ").");
		}
	}

	for (auto const* projection : sending) {
		RoleTable const roles({{Role::pre, cell_name}}, {Role::pre});
		for (auto const& port_connection : projection->port_connections) {
			auto const port_exposures = roles.expose(port_connection);
			exposures.insert(port_exposures.begin(), port_exposures.end());
		}
	}

	dynamics::MultiComponent component(
	    population_name, std::move(sub_components), std::move(internal_connections),
	    std::move(exposures));
	// throws on colliding namespaced names
	static_cast<void>(component.get_dynamics());

	result.component_arrays.add(
	    population_name,
	    ComponentArray(
	        population_name, population.size, std::move(component), std::move(synapses),
	        std::move(connection_property_sets)));
	result.duration = std::chrono::microseconds(timer.get_us());
	LOG4CXX_TRACE(
	    m_logger, "flatten_population(): Flattened population(" << population_name << ") in "
	                                                            << timer.print() << ".");
	return result;
}

FlatteningResult NetworkFlattener::flatten(network::Network const& network) const
{
	hate::Timer timer;
	validate(network);

	std::vector<std::string> population_names;
	for (auto const& [name, _] : network.populations) {
		population_names.push_back(name);
	}

	FlatteningResult result;
	if (m_config.enable_parallel) {
		std::mutex mutex;
		tbb::parallel_for_each(
		    population_names.begin(), population_names.end(), [&](std::string const& name) {
			    auto local = flatten_population(network, name);
			    std::unique_lock<std::mutex> lock(mutex);
			    result.merge(std::move(local));
		    });
	} else {
		for (auto const& name : population_names) {
			result.merge(flatten_population(network, name));
		}
	}
	result.duration = std::chrono::microseconds(timer.get_us());

	LOG4CXX_TRACE(
	    m_logger, "flatten(): Flattened network to " << result.component_arrays.size()
	                                                 << " component arrays and "
	                                                 << result.connection_groups.size()
	                                                 << " connection groups in " << timer.print()
	                                                 << ".");
	LOG4CXX_DEBUG(m_logger, "flatten(): " << result);
	return result;
}


FlatteningResult flatten_network(network::Network const& network, FlattenerConfig const& config)
{
	return NetworkFlattener(config).flatten(network);
}

} // namespace sinter::flattening
