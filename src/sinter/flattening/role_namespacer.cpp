#include "sinter/flattening/role_namespacer.h"

#include "sinter/common/namespace.h"
#include "sinter/exception.h"
#include <ostream>
#include <sstream>

namespace sinter::flattening {

RoleTable::RoleTable(
    std::map<network::Role, std::string> names, std::set<network::Role> const& required) :
    m_names(std::move(names))
{
	for (auto const role : required) {
		if (!m_names.contains(role)) {
			std::stringstream ss;
			ss << "Role table lacks required role(" << role << ").";
			throw InvalidRoleError(ss.str());
		}
	}
	std::set<std::string> unique;
	for (auto const& [role, name] : m_names) {
		if (common::is_namespaced(name)) {
			std::stringstream ss;
			ss << "Name(" << name << ") of role(" << role << ") contains namespace separator.";
			throw NamespaceCollisionError(ss.str());
		}
		if (!unique.insert(name).second) {
			throw NamespaceCollisionError("Name(" + name + ") is used by more than one role.");
		}
	}
}

std::string const& RoleTable::get_name(network::Role const role) const
{
	if (!m_names.contains(role)) {
		std::stringstream ss;
		ss << "Role(" << role << ") not present in role table.";
		throw InvalidRoleError(ss.str());
	}
	return m_names.at(role);
}

bool RoleTable::contains(network::Role const role) const
{
	return m_names.contains(role);
}

std::string RoleTable::append_namespace(std::string const& port, network::Role const role) const
{
	return common::append_namespace(port, get_name(role));
}

std::string RoleTable::get_port_name(std::string const& port, network::Role const role) const
{
	if (!contains(role)) {
		return port;
	}
	return append_namespace(port, role);
}

dynamics::InternalConnection RoleTable::to_internal(
    network::PortConnection const& port_connection) const
{
	return dynamics::InternalConnection{
	    get_name(port_connection.sender_role), port_connection.send_port,
	    get_name(port_connection.receiver_role), port_connection.receive_port};
}

std::vector<dynamics::Exposure> RoleTable::expose(
    network::PortConnection const& port_connection) const
{
	std::vector<dynamics::Exposure> exposures;
	if (contains(port_connection.sender_role)) {
		exposures.push_back(
		    dynamics::Exposure{get_name(port_connection.sender_role), port_connection.send_port});
	}
	if (contains(port_connection.receiver_role)) {
		exposures.push_back(dynamics::Exposure{
		    get_name(port_connection.receiver_role), port_connection.receive_port});
	}
	return exposures;
}

std::ostream& operator<<(std::ostream& os, RoleTable const& table)
{
	os << "RoleTable(";
	bool first = true;
	for (auto const& [role, name] : table.m_names) {
		if (!first) {
			os << ", ";
		}
		os << role << ": " << name;
		first = false;
	}
	return os << ")";
}

} // namespace sinter::flattening
