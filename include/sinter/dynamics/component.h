#pragma once
#include "sinter/common/property.h"
#include "sinter/dynamics/dynamics.h"
#include "sinter/dynamics/value.h"
#include "hate/visibility.h"
#include <map>
#include <string>

namespace sinter::dynamics {

/**
 * Parametrized dynamics, either a single definition or an aggregate of named sub-components.
 */
struct SYMBOL_VISIBLE Component : public common::Property<Component>
{
	virtual std::string const& get_name() const = 0;

	/**
	 * Get dynamics with all sub-components merged into one namespaced definition.
	 */
	virtual Dynamics get_dynamics() const = 0;

	/**
	 * Get property values of parameters of the flattened dynamics.
	 */
	virtual std::map<std::string, Quantity> get_properties() const = 0;

	/**
	 * Get initial values of state variables of the flattened dynamics.
	 */
	virtual std::map<std::string, Quantity> get_initial_values() const = 0;
};

} // namespace sinter::dynamics
