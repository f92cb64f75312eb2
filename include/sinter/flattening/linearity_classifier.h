#pragma once
#include "sinter/dynamics/component.h"
#include "sinter/dynamics/dynamics.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <string>
#include <variant>

namespace sinter::flattening {

/**
 * Synapse which can be embedded once per target cell.
 */
struct SYMBOL_VISIBLE Embeddable
{
	/** Flattened synapse dynamics. */
	dynamics::Dynamics dynamics;

	bool operator==(Embeddable const& other) const = default;
	bool operator!=(Embeddable const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, Embeddable const& value) SYMBOL_VISIBLE;
};

/**
 * Synapse which needs to be instantiated once per connection.
 */
struct SYMBOL_VISIBLE Unflattenable
{
	std::string reason;

	bool operator==(Unflattenable const& other) const = default;
	bool operator!=(Unflattenable const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, Unflattenable const& value)
	    SYMBOL_VISIBLE;
};

typedef std::variant<Embeddable, Unflattenable> LinearityClassification;

/**
 * Classify synapse by linearity of its flattened dynamics in its own state variables.
 * Only linear synapses can be embedded, since the sum of the states of all synapses onto a
 * cell then evolves like a single synapse instance.
 * @param synapse Synapse to classify
 */
LinearityClassification classify_linearity(dynamics::Component const& synapse) SYMBOL_VISIBLE;

} // namespace sinter::flattening
