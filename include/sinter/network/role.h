#pragma once
#include "hate/visibility.h"
#include <iosfwd>

namespace sinter::network {

/**
 * Logical position of a port connection endpoint within a projection.
 */
enum class Role
{
	/** Source population cell. */
	pre,
	/** Target population cell. */
	post,
	/** Post-synaptic response dynamics. */
	response,
	/** Plasticity dynamics. */
	plasticity,
	/** Merged response and plasticity dynamics. */
	synapse
};

std::ostream& operator<<(std::ostream& os, Role role) SYMBOL_VISIBLE;

} // namespace sinter::network
