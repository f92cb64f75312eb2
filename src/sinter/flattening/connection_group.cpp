#include "sinter/flattening/connection_group.h"

#include <ostream>

namespace sinter::flattening {

ConnectionGroup::ConnectionGroup(
    std::string name,
    std::string source,
    std::string destination,
    std::string source_port,
    std::string destination_port,
    network::ConnectivityRule const& connectivity,
    dynamics::Quantity delay) :
    name(std::move(name)),
    source(std::move(source)),
    destination(std::move(destination)),
    source_port(std::move(source_port)),
    destination_port(std::move(destination_port)),
    connectivity(connectivity),
    delay(std::move(delay))
{}

std::ostream& ConnectionGroup::print(std::ostream& os) const
{
	return os << "ConnectionGroup(" << name << ", " << get_communication() << ", " << source
	          << "." << source_port << " -> " << destination << "." << destination_port << ", "
	          << connectivity << ", delay: " << delay << ")";
}

bool ConnectionGroup::is_equal_to(ConnectionGroup const& other) const
{
	return name == other.name && source == other.source && destination == other.destination &&
	       source_port == other.source_port && destination_port == other.destination_port &&
	       connectivity == other.connectivity && delay == other.delay;
}


dynamics::Communication EventConnectionGroup::get_communication() const
{
	return dynamics::Communication::event;
}

std::unique_ptr<ConnectionGroup> EventConnectionGroup::copy() const
{
	return std::make_unique<EventConnectionGroup>(*this);
}

std::unique_ptr<ConnectionGroup> EventConnectionGroup::move()
{
	return std::make_unique<EventConnectionGroup>(std::move(*this));
}


dynamics::Communication AnalogConnectionGroup::get_communication() const
{
	return dynamics::Communication::analog;
}

std::unique_ptr<ConnectionGroup> AnalogConnectionGroup::copy() const
{
	return std::make_unique<AnalogConnectionGroup>(*this);
}

std::unique_ptr<ConnectionGroup> AnalogConnectionGroup::move()
{
	return std::make_unique<AnalogConnectionGroup>(std::move(*this));
}

} // namespace sinter::flattening
