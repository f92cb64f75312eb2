#pragma once
#include "sinter/common/property.h"
#include "sinter/dynamics/multi_component.h"
#include "sinter/flattening/connection_property_set.h"
#include "sinter/flattening/synapse_properties.h"
#include "hate/visibility.h"
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace sinter::flattening {

/**
 * Flattened population consisting of cells with embedded synapses, synapses instantiated per
 * connection and properties varying per connection of embedded synapses.
 */
struct SYMBOL_VISIBLE ComponentArray final : public common::Property<ComponentArray>
{
	std::string name;
	size_t size;
	/** Cell and embedded synapses. */
	dynamics::MultiComponent component;
	/** Synapses instantiated per connection, ordered by name. */
	std::vector<SynapseProperties> synapses;
	/** Properties varying per connection, ordered by port. */
	std::vector<ConnectionPropertySet> connection_property_sets;

	ComponentArray(
	    std::string name,
	    size_t size,
	    dynamics::MultiComponent component,
	    std::vector<SynapseProperties> synapses = {},
	    std::vector<ConnectionPropertySet> connection_property_sets = {}) SYMBOL_VISIBLE;

	/**
	 * Get synapse instantiated per connection of given projection.
	 * @throws std::out_of_range On no such synapse being present
	 */
	SynapseProperties const& get_synapse(std::string const& projection) const SYMBOL_VISIBLE;

	/**
	 * Get property set delivered with events on given port.
	 * @throws std::out_of_range On no such property set being present
	 */
	ConnectionPropertySet const& get_connection_property_set(std::string const& port) const
	    SYMBOL_VISIBLE;

	virtual std::unique_ptr<ComponentArray> copy() const override;
	virtual std::unique_ptr<ComponentArray> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ComponentArray const& other) const override;
};

} // namespace sinter::flattening
