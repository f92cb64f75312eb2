#pragma once
#include "hate/visibility.h"
#include <iosfwd>
#include <string>
#include <vector>

namespace sinter::network {

/**
 * Named union of populations usable as projection source or target.
 */
struct SYMBOL_VISIBLE Selection
{
	std::string name;
	/** Names of member populations in order. */
	std::vector<std::string> populations;

	bool operator==(Selection const& other) const = default;
	bool operator!=(Selection const& other) const = default;

	friend std::ostream& operator<<(std::ostream& os, Selection const& selection) SYMBOL_VISIBLE;
};

} // namespace sinter::network
