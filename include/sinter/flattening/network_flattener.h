#pragma once
#include "sinter/common/map.h"
#include "sinter/flattening/component_array.h"
#include "sinter/flattening/config.h"
#include "sinter/flattening/connection_group.h"
#include "sinter/network/network.h"
#include "hate/visibility.h"
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>

namespace log4cxx {
class Logger;
typedef std::shared_ptr<Logger> LoggerPtr;
} // namespace log4cxx

namespace sinter::flattening {

/**
 * Flattened network ready for instantiation by a simulator back-end.
 */
struct SYMBOL_VISIBLE FlatteningResult
{
	/** Component arrays by population name. */
	common::Map<std::string, ComponentArray> component_arrays;

	/** Connection groups by name. */
	common::Map<std::string, ConnectionGroup> connection_groups;

	/**
	 * Duration spent during flattening.
	 * This value is not compared in operator{==,!=}.
	 */
	std::chrono::microseconds duration{0};

	/**
	 * Move all component arrays and connection groups of other result into this result.
	 * @param other Result to merge
	 * @throws NameCollisionError On a name being present in both results
	 */
	void merge(FlatteningResult&& other) SYMBOL_VISIBLE;

	bool operator==(FlatteningResult const& other) const SYMBOL_VISIBLE;
	bool operator!=(FlatteningResult const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, FlatteningResult const& value)
	    SYMBOL_VISIBLE;
};


/**
 * Converter of a network into component arrays and connection groups.
 * Synapses with linear dynamics are embedded into the target population's component, others
 * are instantiated per connection. Each population is flattened independently.
 */
class SYMBOL_VISIBLE NetworkFlattener
{
public:
	NetworkFlattener(FlattenerConfig config = FlattenerConfig()) SYMBOL_VISIBLE;

	FlattenerConfig const& get_config() const SYMBOL_VISIBLE;

	/**
	 * Check that the network can be flattened.
	 * Names of populations, selections and projections are required to be unique and different
	 * from the cell role name and all references are required to resolve.
	 * @throws NameCollisionError On duplicate names
	 * @throws ReservedNameError On use of the cell role name
	 * @throws StructuralError On unresolved references
	 */
	void validate(network::Network const& network) const SYMBOL_VISIBLE;

	/**
	 * Flatten single population.
	 * The result contains the population's component array and all connection groups of
	 * connections into and out of projections targeting the population.
	 * @param network Network containing population
	 * @param population Name of population to flatten
	 * @throws StructuralError On structurally invalid projections
	 */
	FlatteningResult flatten_population(
	    network::Network const& network, std::string const& population) const SYMBOL_VISIBLE;

	/**
	 * Validate and flatten complete network.
	 * @param network Network to flatten
	 * @throws StructuralError On network not being valid
	 */
	FlatteningResult flatten(network::Network const& network) const SYMBOL_VISIBLE;

private:
	FlattenerConfig m_config;
	log4cxx::LoggerPtr m_logger;
};


/**
 * Validate and flatten complete network.
 * @param network Network to flatten
 * @param config Flattening configuration
 * @throws StructuralError On network not being valid
 */
FlatteningResult flatten_network(
    network::Network const& network, FlattenerConfig const& config = FlattenerConfig())
    SYMBOL_VISIBLE;

} // namespace sinter::flattening
