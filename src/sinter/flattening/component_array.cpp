#include "sinter/flattening/component_array.h"

#include "hate/indent.h"
#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace sinter::flattening {

ComponentArray::ComponentArray(
    std::string name,
    size_t const size,
    dynamics::MultiComponent component,
    std::vector<SynapseProperties> synapses,
    std::vector<ConnectionPropertySet> connection_property_sets) :
    name(std::move(name)),
    size(size),
    component(std::move(component)),
    synapses(std::move(synapses)),
    connection_property_sets(std::move(connection_property_sets))
{
	std::sort(this->synapses.begin(), this->synapses.end(), [](auto const& a, auto const& b) {
		return a.name < b.name;
	});
	std::sort(
	    this->connection_property_sets.begin(), this->connection_property_sets.end(),
	    [](auto const& a, auto const& b) { return a.port < b.port; });
}

SynapseProperties const& ComponentArray::get_synapse(std::string const& projection) const
{
	auto const it = std::find_if(synapses.begin(), synapses.end(), [projection](auto const& s) {
		return s.name == projection;
	});
	if (it == synapses.end()) {
		throw std::out_of_range(
		    "Component array(" + name + ") doesn't feature synapse of projection(" + projection +
		    ").");
	}
	return *it;
}

ConnectionPropertySet const& ComponentArray::get_connection_property_set(
    std::string const& port) const
{
	auto const it = std::find_if(
	    connection_property_sets.begin(), connection_property_sets.end(),
	    [port](auto const& set) { return set.port == port; });
	if (it == connection_property_sets.end()) {
		throw std::out_of_range(
		    "Component array(" + name + ") doesn't feature connection property set for port(" +
		    port + ").");
	}
	return *it;
}

std::unique_ptr<ComponentArray> ComponentArray::copy() const
{
	return std::make_unique<ComponentArray>(*this);
}

std::unique_ptr<ComponentArray> ComponentArray::move()
{
	return std::make_unique<ComponentArray>(std::move(*this));
}

std::ostream& ComponentArray::print(std::ostream& os) const
{
	hate::IndentingOstream ios(os);
	ios << "ComponentArray(\n" << hate::Indentation("\t");
	ios << "name: " << name << "\n";
	ios << "size: " << size << "\n";
	ios << component << "\n";
	ios << "synapses:\n" << hate::Indentation("\t\t");
	for (auto const& synapse : synapses) {
		ios << synapse << "\n";
	}
	ios << hate::Indentation("\t") << "connection property sets:\n" << hate::Indentation("\t\t");
	for (auto const& connection_property_set : connection_property_sets) {
		ios << connection_property_set << "\n";
	}
	ios << hate::Indentation() << ")";
	return os;
}

bool ComponentArray::is_equal_to(ComponentArray const& other) const
{
	return name == other.name && size == other.size && component == other.component &&
	       synapses == other.synapses &&
	       connection_property_sets == other.connection_property_sets;
}

} // namespace sinter::flattening
