#include "sinter/network/selection.h"

#include "hate/join.h"
#include <ostream>

namespace sinter::network {

std::ostream& operator<<(std::ostream& os, Selection const& selection)
{
	return os << "Selection(" << selection.name << ": " << hate::join(selection.populations, ", ")
	          << ")";
}

} // namespace sinter::network
