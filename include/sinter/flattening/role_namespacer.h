#pragma once
#include "sinter/common/namespace.h"
#include "sinter/dynamics/multi_component.h"
#include "sinter/network/port_connection.h"
#include "sinter/network/role.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sinter::flattening {

/**
 * Assignment of sub-component names to the roles of a container.
 * Names are unique and free of the namespace separator, so that namespaced port names are
 * unambiguous.
 */
struct SYMBOL_VISIBLE RoleTable
{
	/**
	 * Construct role table.
	 * @param names Sub-component name for each role
	 * @param required Roles which need to be present
	 * @throws InvalidRoleError On required role missing
	 * @throws NamespaceCollisionError On names not being unique or containing the namespace
	 * separator
	 */
	RoleTable(std::map<network::Role, std::string> names, std::set<network::Role> const& required)
	    SYMBOL_VISIBLE;

	/**
	 * Get sub-component name of role.
	 * @throws InvalidRoleError On role not being present
	 */
	std::string const& get_name(network::Role role) const SYMBOL_VISIBLE;

	bool contains(network::Role role) const SYMBOL_VISIBLE;

	/**
	 * Place port in namespace of sub-component of given role.
	 * @throws InvalidRoleError On role not being present
	 */
	std::string append_namespace(std::string const& port, network::Role role) const
	    SYMBOL_VISIBLE;

	/**
	 * Get port name as seen from outside the sub-component of the role.
	 * Ports of roles not present in the table are left unchanged.
	 */
	std::string get_port_name(std::string const& port, network::Role role) const SYMBOL_VISIBLE;

	/**
	 * Convert port connection into connection between sub-components.
	 * @throws InvalidRoleError On sender or receiver role not being present
	 */
	dynamics::InternalConnection to_internal(network::PortConnection const& port_connection) const
	    SYMBOL_VISIBLE;

	/**
	 * Get exposures of all endpoints of the port connection whose role is present.
	 */
	std::vector<dynamics::Exposure> expose(network::PortConnection const& port_connection) const
	    SYMBOL_VISIBLE;

	bool operator==(RoleTable const& other) const = default;
	bool operator!=(RoleTable const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, RoleTable const& table) SYMBOL_VISIBLE;

private:
	std::map<network::Role, std::string> m_names;
};

} // namespace sinter::flattening
