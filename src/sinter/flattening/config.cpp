#include "sinter/flattening/config.h"

#include <ostream>

namespace sinter::flattening {

std::ostream& operator<<(std::ostream& os, FlattenerConfig const& config)
{
	return os << "FlattenerConfig(cell: " << config.cell_role_name
	          << ", response: " << config.response_role_name
	          << ", plasticity: " << config.plasticity_role_name
	          << ", synapse suffix: " << config.synapse_name_suffix
	          << ", parallel: " << std::boolalpha << config.enable_parallel << ")";
}

} // namespace sinter::flattening
