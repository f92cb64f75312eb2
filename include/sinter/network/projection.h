#pragma once
#include "sinter/common/property_holder.h"
#include "sinter/dynamics/dynamics_properties.h"
#include "sinter/dynamics/value.h"
#include "sinter/network/connectivity.h"
#include "sinter/network/port_connection.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sinter::network {

/**
 * Structured edge set connecting a source to a target through a synapse.
 * The synapse is described by separate response and optional plasticity dynamics, which are
 * wired to the source and target cells by port connections.
 */
struct SYMBOL_VISIBLE Projection
{
	std::string name;
	/** Name of source population or selection. */
	std::string pre;
	/** Name of target population or selection. */
	std::string post;
	common::PropertyHolder<ConnectivityRule> connectivity;
	/** Delay of connections from the source. */
	dynamics::Quantity delay;
	dynamics::DynamicsProperties response;
	std::optional<dynamics::DynamicsProperties> plasticity;
	std::vector<PortConnection> port_connections;

	Projection(
	    std::string name,
	    std::string pre,
	    std::string post,
	    ConnectivityRule const& connectivity,
	    dynamics::Quantity delay,
	    dynamics::DynamicsProperties response,
	    std::optional<dynamics::DynamicsProperties> plasticity,
	    std::vector<PortConnection> port_connections) SYMBOL_VISIBLE;

	/**
	 * Get whether the projection features the given role.
	 * Only roles of the description itself are present, i.e. never Role::synapse.
	 */
	bool has_role(Role role) const SYMBOL_VISIBLE;

	bool operator==(Projection const& other) const SYMBOL_VISIBLE;
	bool operator!=(Projection const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Projection const& projection)
	    SYMBOL_VISIBLE;
};

} // namespace sinter::network
