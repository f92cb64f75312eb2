#include "sinter/network/network.h"

#include "hate/indent.h"
#include <ostream>
#include <stdexcept>

namespace sinter::network {

std::vector<std::string> Network::resolve(std::string const& reference) const
{
	if (populations.contains(reference)) {
		return {reference};
	}
	if (selections.contains(reference)) {
		return selections.at(reference).populations;
	}
	throw std::out_of_range(
	    "Network doesn't feature population or selection with name(" + reference + ").");
}

bool Network::is_selection(std::string const& reference) const
{
	return selections.contains(reference);
}

bool Network::operator==(Network const& other) const
{
	return populations == other.populations && selections == other.selections &&
	       projections == other.projections;
}

bool Network::operator!=(Network const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Network const& network)
{
	hate::IndentingOstream ios(os);
	ios << "Network(\n" << hate::Indentation("\t");
	ios << "populations:\n" << hate::Indentation("\t\t");
	for (auto const& [name, population] : network.populations) {
		ios << population << "\n";
	}
	ios << hate::Indentation("\t") << "selections:\n" << hate::Indentation("\t\t");
	for (auto const& [name, selection] : network.selections) {
		ios << selection << "\n";
	}
	ios << hate::Indentation("\t") << "projections:\n" << hate::Indentation("\t\t");
	for (auto const& [name, projection] : network.projections) {
		ios << projection << "\n";
	}
	ios << hate::Indentation() << ")";
	return os;
}

} // namespace sinter::network
