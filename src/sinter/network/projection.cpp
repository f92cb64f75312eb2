#include "sinter/network/projection.h"

#include "hate/indent.h"
#include "hate/join.h"
#include <ostream>

namespace sinter::network {

Projection::Projection(
    std::string name,
    std::string pre,
    std::string post,
    ConnectivityRule const& connectivity,
    dynamics::Quantity delay,
    dynamics::DynamicsProperties response,
    std::optional<dynamics::DynamicsProperties> plasticity,
    std::vector<PortConnection> port_connections) :
    name(std::move(name)),
    pre(std::move(pre)),
    post(std::move(post)),
    connectivity(connectivity),
    delay(std::move(delay)),
    response(std::move(response)),
    plasticity(std::move(plasticity)),
    port_connections(std::move(port_connections))
{}

bool Projection::has_role(Role const role) const
{
	switch (role) {
		case Role::pre:
		case Role::post:
		case Role::response:
			return true;
		case Role::plasticity:
			return plasticity.has_value();
		default:
			return false;
	}
}

bool Projection::operator==(Projection const& other) const
{
	return name == other.name && pre == other.pre && post == other.post &&
	       connectivity == other.connectivity && delay == other.delay &&
	       response == other.response && plasticity == other.plasticity &&
	       port_connections == other.port_connections;
}

bool Projection::operator!=(Projection const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Projection const& projection)
{
	hate::IndentingOstream ios(os);
	ios << "Projection(\n" << hate::Indentation("\t");
	ios << "name: " << projection.name << "\n";
	ios << "pre: " << projection.pre << "\n";
	ios << "post: " << projection.post << "\n";
	ios << "connectivity: " << projection.connectivity << "\n";
	ios << "delay: " << projection.delay << "\n";
	ios << "response: " << projection.response << "\n";
	if (projection.plasticity) {
		ios << "plasticity: " << *projection.plasticity << "\n";
	}
	ios << "port connections:\n" << hate::Indentation("\t\t");
	ios << hate::join(projection.port_connections, "\n");
	ios << hate::Indentation() << "\n)";
	return os;
}

} // namespace sinter::network
