#include "sinter/network/role.h"

#include <ostream>
#include <stdexcept>

namespace sinter::network {

std::ostream& operator<<(std::ostream& os, Role const role)
{
	switch (role) {
		case Role::pre:
			return os << "pre";
		case Role::post:
			return os << "post";
		case Role::response:
			return os << "response";
		case Role::plasticity:
			return os << "plasticity";
		case Role::synapse:
			return os << "synapse";
	}
	throw std::logic_error("Unknown role.");
}

} // namespace sinter::network
