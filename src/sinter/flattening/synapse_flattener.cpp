#include "sinter/flattening/synapse_flattener.h"

#include "sinter/exception.h"
#include "sinter/flattening/role_namespacer.h"
#include "hate/indent.h"
#include "hate/join.h"
#include "hate/timer.h"
#include <ostream>
#include <sstream>
#include <log4cxx/logger.h>

namespace sinter::flattening {

using network::Role;

bool FlattenedSynapse::operator==(FlattenedSynapse const& other) const
{
	return synapse == other.synapse && port_connections == other.port_connections;
}

bool FlattenedSynapse::operator!=(FlattenedSynapse const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, FlattenedSynapse const& value)
{
	hate::IndentingOstream ios(os);
	ios << "FlattenedSynapse(\n" << hate::Indentation("\t");
	ios << value.synapse << "\n";
	ios << "port connections:\n" << hate::Indentation("\t\t");
	ios << hate::join(value.port_connections, "\n");
	ios << hate::Indentation() << "\n)";
	return os;
}

namespace {

bool is_synapse_part(Role const role)
{
	return role == Role::response || role == Role::plasticity;
}

bool is_cell(Role const role)
{
	return role == Role::pre || role == Role::post;
}

} // namespace

FlattenedSynapse flatten_synapse(
    network::Projection const& projection, FlattenerConfig const& config)
{
	auto logger = log4cxx::Logger::getLogger("sinter.flatten_synapse");
	hate::Timer timer;

	std::map<Role, std::string> names{{Role::response, config.response_role_name}};
	dynamics::MultiComponent::SubComponents sub_components{
	    {config.response_role_name, projection.response}};
	if (projection.plasticity) {
		names.emplace(Role::plasticity, config.plasticity_role_name);
		sub_components.emplace(config.plasticity_role_name, *projection.plasticity);
	}
	RoleTable const roles(std::move(names), {Role::response});

	std::set<dynamics::InternalConnection> internal_connections;
	std::set<dynamics::Exposure> exposures;
	std::vector<network::PortConnection> incoming;
	std::vector<network::PortConnection> outgoing;
	std::vector<network::PortConnection> passing;
	for (auto const& port_connection : projection.port_connections) {
		auto const sender = port_connection.sender_role;
		auto const receiver = port_connection.receiver_role;
		if (!(is_synapse_part(sender) || is_cell(sender)) ||
		    !(is_synapse_part(receiver) || is_cell(receiver))) {
			std::stringstream ss;
			ss << port_connection << " of projection(" << projection.name
			   << ") uses role outside of pre, post, response and plasticity.";
			LOG4CXX_ERROR(logger, "flatten_synapse(): " << ss.str());
			throw InvalidRoleError(ss.str());
		}
		if (is_synapse_part(sender) && is_synapse_part(receiver)) {
			internal_connections.insert(roles.to_internal(port_connection));
		} else if (is_cell(sender) && is_synapse_part(receiver)) {
			exposures.insert(dynamics::Exposure{roles.get_name(receiver), port_connection.receive_port});
			incoming.push_back(network::PortConnection{
			    sender, Role::synapse, port_connection.send_port,
			    roles.append_namespace(port_connection.receive_port, receiver),
			    port_connection.communication});
		} else if (is_synapse_part(sender) && is_cell(receiver)) {
			exposures.insert(dynamics::Exposure{roles.get_name(sender), port_connection.send_port});
			outgoing.push_back(network::PortConnection{
			    Role::synapse, receiver, roles.append_namespace(port_connection.send_port, sender),
			    port_connection.receive_port, port_connection.communication});
		} else {
			passing.push_back(port_connection);
		}
	}

	FlattenedSynapse flattened{
	    dynamics::MultiComponent(
	        projection.name + config.synapse_name_suffix, std::move(sub_components),
	        std::move(internal_connections), std::move(exposures)),
	    {}};
	flattened.port_connections = std::move(incoming);
	flattened.port_connections.insert(
	    flattened.port_connections.end(), outgoing.begin(), outgoing.end());
	flattened.port_connections.insert(
	    flattened.port_connections.end(), passing.begin(), passing.end());

	LOG4CXX_TRACE(
	    logger, "flatten_synapse(): Flattened synapse of projection(" << projection.name << ") in "
	                                                                  << timer.print() << ".");
	return flattened;
}

} // namespace sinter::flattening
