#include "sinter/network/port_connection.h"

#include <ostream>
#include <tuple>

namespace sinter::network {

bool PortConnection::touches(Role const role) const
{
	return sender_role == role || receiver_role == role;
}

bool PortConnection::operator<(PortConnection const& other) const
{
	return std::tie(sender_role, send_port, receiver_role, receive_port, communication) <
	       std::tie(
	           other.sender_role, other.send_port, other.receiver_role, other.receive_port,
	           other.communication);
}

std::ostream& operator<<(std::ostream& os, PortConnection const& value)
{
	return os << "PortConnection(" << value.sender_role << "." << value.send_port << " -> "
	          << value.receiver_role << "." << value.receive_port << ", " << value.communication
	          << ")";
}

} // namespace sinter::network
