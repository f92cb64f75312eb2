#pragma once
#include "sinter/common/property.h"
#include "sinter/common/property_holder.h"
#include "sinter/dynamics/dynamics.h"
#include "sinter/dynamics/value.h"
#include "sinter/network/connectivity.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <memory>
#include <string>

namespace sinter::flattening {

/**
 * Flattened connections from a port of one component array to a port of another.
 */
struct SYMBOL_VISIBLE ConnectionGroup : public common::Property<ConnectionGroup>
{
	std::string name;
	/** Name of source component array or selection of arrays. */
	std::string source;
	/** Name of destination component array or selection of arrays. */
	std::string destination;
	std::string source_port;
	std::string destination_port;
	common::PropertyHolder<network::ConnectivityRule> connectivity;
	dynamics::Quantity delay;

	ConnectionGroup(
	    std::string name,
	    std::string source,
	    std::string destination,
	    std::string source_port,
	    std::string destination_port,
	    network::ConnectivityRule const& connectivity,
	    dynamics::Quantity delay) SYMBOL_VISIBLE;

	virtual dynamics::Communication get_communication() const = 0;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectionGroup const& other) const override;
};


/** Connection group transmitting events. */
struct SYMBOL_VISIBLE EventConnectionGroup final : public ConnectionGroup
{
	using ConnectionGroup::ConnectionGroup;

	virtual dynamics::Communication get_communication() const override;

	virtual std::unique_ptr<ConnectionGroup> copy() const override;
	virtual std::unique_ptr<ConnectionGroup> move() override;
};


/** Connection group transmitting continuous values. */
struct SYMBOL_VISIBLE AnalogConnectionGroup final : public ConnectionGroup
{
	using ConnectionGroup::ConnectionGroup;

	virtual dynamics::Communication get_communication() const override;

	virtual std::unique_ptr<ConnectionGroup> copy() const override;
	virtual std::unique_ptr<ConnectionGroup> move() override;
};

} // namespace sinter::flattening
