#pragma once
#include "sinter/dynamics/component.h"
#include "sinter/dynamics/value.h"
#include "sinter/flattening/linearity_classifier.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace sinter::flattening {

/**
 * Properties varying per connection of an embedded synapse.
 * The values are delivered along with each event on the triggering port.
 */
struct SYMBOL_VISIBLE ConnectionPropertySet
{
	/** Namespaced event port triggering the use of the properties. */
	std::string port;
	/** Namespaced property names and their per-connection values. */
	std::map<std::string, dynamics::Quantity> properties;

	bool operator==(ConnectionPropertySet const& other) const = default;
	bool operator!=(ConnectionPropertySet const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, ConnectionPropertySet const& value)
	    SYMBOL_VISIBLE;
};

typedef std::variant<std::vector<ConnectionPropertySet>, Unflattenable>
    ConnectionPropertyExtraction;

/**
 * Extract properties of a synapse varying between its instances into per-port property sets.
 * Varying properties may only be applied on events. If one of them is required by time
 * derivatives or on-conditions, the synapse can't be shared among connections and is reported
 * unflattenable.
 * @param synapse Synapse to extract properties from
 * @param ns Namespace to place ports and properties in, i.e. the projection name
 * @return Property sets ordered by port or reason preventing extraction
 */
ConnectionPropertyExtraction extract_connection_property_sets(
    dynamics::Component const& synapse, std::string const& ns) SYMBOL_VISIBLE;

} // namespace sinter::flattening
