#include "sinter/flattening/synapse_properties.h"

#include "hate/indent.h"
#include "hate/join.h"
#include <ostream>

namespace sinter::flattening {

bool SynapseProperties::operator==(SynapseProperties const& other) const
{
	return name == other.name && synapse == other.synapse &&
	       port_connections == other.port_connections;
}

bool SynapseProperties::operator!=(SynapseProperties const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, SynapseProperties const& value)
{
	hate::IndentingOstream ios(os);
	ios << "SynapseProperties(\n" << hate::Indentation("\t");
	ios << "name: " << value.name << "\n";
	ios << value.synapse << "\n";
	ios << "port connections:\n" << hate::Indentation("\t\t");
	ios << hate::join(value.port_connections, "\n");
	ios << hate::Indentation() << "\n)";
	return os;
}

} // namespace sinter::flattening
