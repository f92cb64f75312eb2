#include "sinter/dynamics/dynamics_properties.h"

#include "hate/indent.h"
#include <ostream>

namespace sinter::dynamics {

DynamicsProperties::DynamicsProperties(
    std::string name,
    Dynamics dynamics,
    std::map<std::string, Quantity> properties,
    std::map<std::string, Quantity> initial_values) :
    name(std::move(name)),
    dynamics(std::move(dynamics)),
    properties(std::move(properties)),
    initial_values(std::move(initial_values))
{}

std::string const& DynamicsProperties::get_name() const
{
	return name;
}

Dynamics DynamicsProperties::get_dynamics() const
{
	return dynamics;
}

std::map<std::string, Quantity> DynamicsProperties::get_properties() const
{
	return properties;
}

std::map<std::string, Quantity> DynamicsProperties::get_initial_values() const
{
	return initial_values;
}

std::unique_ptr<Component> DynamicsProperties::copy() const
{
	return std::make_unique<DynamicsProperties>(*this);
}

std::unique_ptr<Component> DynamicsProperties::move()
{
	return std::make_unique<DynamicsProperties>(std::move(*this));
}

std::ostream& DynamicsProperties::print(std::ostream& os) const
{
	hate::IndentingOstream ios(os);
	ios << "DynamicsProperties(\n" << hate::Indentation("\t");
	ios << "name: " << name << "\n";
	ios << dynamics << "\n";
	ios << "properties:\n" << hate::Indentation("\t\t");
	for (auto const& [key, value] : properties) {
		ios << key << ": " << value << "\n";
	}
	ios << hate::Indentation("\t") << "initial values:\n" << hate::Indentation("\t\t");
	for (auto const& [key, value] : initial_values) {
		ios << key << ": " << value << "\n";
	}
	ios << hate::Indentation() << ")";
	return os;
}

bool DynamicsProperties::is_equal_to(Component const& other) const
{
	auto const& other_properties = static_cast<DynamicsProperties const&>(other);
	return name == other_properties.name && dynamics == other_properties.dynamics &&
	       properties == other_properties.properties &&
	       initial_values == other_properties.initial_values;
}

} // namespace sinter::dynamics
