#include "sinter/common/property.h"

#include <ostream>

namespace sinter::common {

Printable::~Printable() {}

std::ostream& operator<<(std::ostream& os, Printable const& printable)
{
	return printable.print(os);
}

} // namespace sinter::common
