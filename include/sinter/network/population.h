#pragma once
#include "sinter/dynamics/dynamics_properties.h"
#include "hate/visibility.h"
#include <cstddef>
#include <iosfwd>
#include <string>

namespace sinter::network {

/**
 * Homogeneous set of cell instances sharing one dynamics definition.
 */
struct SYMBOL_VISIBLE Population
{
	std::string name;
	size_t size;
	/** Cell dynamics, its properties and initial state. */
	dynamics::DynamicsProperties cell;

	Population(std::string name, size_t size, dynamics::DynamicsProperties cell) SYMBOL_VISIBLE;

	/**
	 * Check validity of population.
	 * A population is valid if it is non-empty and its cell dynamics is valid.
	 */
	bool valid() const SYMBOL_VISIBLE;

	bool operator==(Population const& other) const SYMBOL_VISIBLE;
	bool operator!=(Population const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Population const& population)
	    SYMBOL_VISIBLE;
};

} // namespace sinter::network
