#include "sinter/network/population.h"

#include "hate/indent.h"
#include <ostream>

namespace sinter::network {

Population::Population(std::string name, size_t const size, dynamics::DynamicsProperties cell) :
    name(std::move(name)), size(size), cell(std::move(cell))
{}

bool Population::valid() const
{
	return size > 0 && cell.dynamics.valid();
}

bool Population::operator==(Population const& other) const
{
	return name == other.name && size == other.size && cell == other.cell;
}

bool Population::operator!=(Population const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Population const& population)
{
	hate::IndentingOstream ios(os);
	ios << "Population(\n" << hate::Indentation("\t");
	ios << "name: " << population.name << "\n";
	ios << "size: " << population.size << "\n";
	ios << "cell: " << population.cell;
	ios << hate::Indentation() << "\n)";
	return os;
}

} // namespace sinter::network
