#pragma once
#include "sinter/dynamics/multi_component.h"
#include "sinter/flattening/config.h"
#include "sinter/network/port_connection.h"
#include "sinter/network/projection.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <vector>

namespace sinter::flattening {

/**
 * Response and plasticity dynamics of a projection merged into one synapse.
 */
struct SYMBOL_VISIBLE FlattenedSynapse
{
	/** Synapse with response and plasticity as sub-components. */
	dynamics::MultiComponent synapse;

	/**
	 * Port connections of the projection with response and plasticity endpoints replaced by the
	 * synapse role and namespaced ports.
	 * Connections into the synapse come first, followed by connections out of the synapse and
	 * connections between pre and post.
	 */
	std::vector<network::PortConnection> port_connections;

	bool operator==(FlattenedSynapse const& other) const SYMBOL_VISIBLE;
	bool operator!=(FlattenedSynapse const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, FlattenedSynapse const& value)
	    SYMBOL_VISIBLE;
};

/**
 * Merge response and plasticity of a projection into one synapse.
 * Connections between response and plasticity become internal connections of the synapse,
 * their ports connected to pre or post are exposed.
 * @param projection Projection to flatten synapse of
 * @param config Configuration supplying sub-component names and synapse name suffix
 * @throws InvalidRoleError On port connection using the synapse role or plasticity without the
 * projection featuring plasticity dynamics
 */
FlattenedSynapse flatten_synapse(
    network::Projection const& projection, FlattenerConfig const& config = FlattenerConfig())
    SYMBOL_VISIBLE;

} // namespace sinter::flattening
