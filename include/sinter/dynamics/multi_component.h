#pragma once
#include "sinter/common/property_holder.h"
#include "sinter/dynamics/component.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace sinter::dynamics {

/**
 * Connection between ports of two sub-components of a multi-component.
 */
struct SYMBOL_VISIBLE InternalConnection
{
	std::string sender;
	std::string send_port;
	std::string receiver;
	std::string receive_port;

	bool operator==(InternalConnection const& other) const = default;
	bool operator!=(InternalConnection const& other) const = default;
	bool operator<(InternalConnection const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, InternalConnection const& value)
	    SYMBOL_VISIBLE;
};


/**
 * Port of a sub-component made accessible at the boundary of the multi-component.
 * The exposed port is named by the port namespaced with the sub-component name.
 */
struct SYMBOL_VISIBLE Exposure
{
	std::string component;
	std::string port;

	std::string get_name() const SYMBOL_VISIBLE;

	bool operator==(Exposure const& other) const = default;
	bool operator!=(Exposure const& other) const = default;
	bool operator<(Exposure const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Exposure const& value) SYMBOL_VISIBLE;
};


/**
 * Aggregate of named sub-components wired by internal connections.
 * Its flattened dynamics features all parameters, state variables and aliases of the
 * sub-components namespaced with their sub-component name, a regime per combination of
 * sub-component regimes and only the exposed ports at its boundary.
 */
struct SYMBOL_VISIBLE MultiComponent final : public Component
{
	typedef std::map<std::string, common::PropertyHolder<Component>> SubComponents;

	/**
	 * Construct multi-component.
	 * @param name Name of multi-component
	 * @param sub_components Sub-components by name
	 * @param internal_connections Connections between sub-components
	 * @param exposures Ports exposed at the boundary
	 * @throws NamespaceCollisionError On sub-component name containing the namespace separator
	 * @throws StructuralError On connection or exposure referring to a missing sub-component or
	 * port or on connected ports not matching in direction or communication
	 */
	MultiComponent(
	    std::string name,
	    SubComponents sub_components,
	    std::set<InternalConnection> internal_connections = {},
	    std::set<Exposure> exposures = {}) SYMBOL_VISIBLE;

	SubComponents const& get_sub_components() const SYMBOL_VISIBLE;
	std::set<InternalConnection> const& get_internal_connections() const SYMBOL_VISIBLE;
	std::set<Exposure> const& get_exposures() const SYMBOL_VISIBLE;

	virtual std::string const& get_name() const override;

	/**
	 * Get flattened dynamics.
	 * Analog connections substitute the receive port by the sender's variable, summing all
	 * senders of reduce ports. Event connections trigger the receiver's on-events by the
	 * sender's output events.
	 * @throws NamespaceCollisionError On namespaced names colliding
	 * @throws StructuralError On an analog receive port being connected more than once or being
	 * neither connected nor exposed
	 */
	virtual Dynamics get_dynamics() const override;

	virtual std::map<std::string, Quantity> get_properties() const override;
	virtual std::map<std::string, Quantity> get_initial_values() const override;

	virtual std::unique_ptr<Component> copy() const override;
	virtual std::unique_ptr<Component> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(Component const& other) const override;

private:
	std::string m_name;
	SubComponents m_sub_components;
	std::set<InternalConnection> m_internal_connections;
	std::set<Exposure> m_exposures;
};

} // namespace sinter::dynamics
