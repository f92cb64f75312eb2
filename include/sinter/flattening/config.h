#pragma once
#include "hate/visibility.h"
#include <iosfwd>
#include <string>

namespace sinter::flattening {

/**
 * Configuration of network flattening.
 */
struct SYMBOL_VISIBLE FlattenerConfig
{
	/**
	 * Name of the cell dynamics within the multi-component of each population.
	 * No population, selection or projection may use this name.
	 */
	std::string cell_role_name = "cell";

	/** Name of the response dynamics within a merged synapse. */
	std::string response_role_name = "psr";

	/** Name of the plasticity dynamics within a merged synapse. */
	std::string plasticity_role_name = "pls";

	/** Suffix appended to the projection name to name its merged synapse. */
	std::string synapse_name_suffix = "_syn";

	/** Flatten populations concurrently. */
	bool enable_parallel = true;

	bool operator==(FlattenerConfig const& other) const = default;
	bool operator!=(FlattenerConfig const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, FlattenerConfig const& config)
	    SYMBOL_VISIBLE;
};

} // namespace sinter::flattening
