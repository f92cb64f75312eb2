#pragma once
#include "sinter/dynamics/multi_component.h"
#include "sinter/network/port_connection.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace sinter::flattening {

/**
 * Synapse which is instantiated once per connection and bound to the target cell.
 */
struct SYMBOL_VISIBLE SynapseProperties
{
	/** Name of the projection the synapse belongs to. */
	std::string name;
	dynamics::MultiComponent synapse;
	/** Connections between the synapse and the target cell. */
	std::vector<network::PortConnection> port_connections;

	bool operator==(SynapseProperties const& other) const SYMBOL_VISIBLE;
	bool operator!=(SynapseProperties const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, SynapseProperties const& value)
	    SYMBOL_VISIBLE;
};

} // namespace sinter::flattening
