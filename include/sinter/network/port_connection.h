#pragma once
#include "sinter/dynamics/dynamics.h"
#include "sinter/network/role.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <string>

namespace sinter::network {

/**
 * Directed connection between ports of two roles of a projection.
 */
struct SYMBOL_VISIBLE PortConnection
{
	Role sender_role;
	Role receiver_role;
	std::string send_port;
	std::string receive_port;
	dynamics::Communication communication;

	/**
	 * Get whether given role is the sender or the receiver.
	 */
	bool touches(Role role) const SYMBOL_VISIBLE;

	bool operator==(PortConnection const& other) const = default;
	bool operator!=(PortConnection const& other) const = default;
	bool operator<(PortConnection const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, PortConnection const& value) SYMBOL_VISIBLE;
};

} // namespace sinter::network
