#pragma once
#include "sinter/network/population.h"
#include "sinter/network/projection.h"
#include "sinter/network/selection.h"
#include "hate/visibility.h"
#include <chrono>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace sinter::network {

/**
 * Network consisting of populations, selections of populations and projections between them.
 * All elements are keyed by their name.
 */
struct SYMBOL_VISIBLE Network
{
	std::map<std::string, Population> const populations;
	std::map<std::string, Selection> const selections;
	std::map<std::string, Projection> const projections;

	/**
	 * Duration spent during construction of network.
	 * This value is not compared in operator{==,!=}.
	 */
	std::chrono::microseconds const construction_duration;

	/**
	 * Get names of populations referred to by a projection endpoint.
	 * @param reference Name of population or selection
	 * @throws std::out_of_range On no population or selection with given name being present
	 */
	std::vector<std::string> resolve(std::string const& reference) const SYMBOL_VISIBLE;

	/**
	 * Get whether given name refers to a selection.
	 */
	bool is_selection(std::string const& reference) const SYMBOL_VISIBLE;

	bool operator==(Network const& other) const SYMBOL_VISIBLE;
	bool operator!=(Network const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Network const& network) SYMBOL_VISIBLE;
};

} // namespace sinter::network
