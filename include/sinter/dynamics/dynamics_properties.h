#pragma once
#include "sinter/dynamics/component.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <memory>
#include <string>

namespace sinter::dynamics {

/**
 * Dynamics definition together with values for its parameters and initial state.
 */
struct SYMBOL_VISIBLE DynamicsProperties final : public Component
{
	std::string name;
	Dynamics dynamics;
	std::map<std::string, Quantity> properties;
	std::map<std::string, Quantity> initial_values;

	DynamicsProperties(
	    std::string name,
	    Dynamics dynamics,
	    std::map<std::string, Quantity> properties = {},
	    std::map<std::string, Quantity> initial_values = {}) SYMBOL_VISIBLE;

	virtual std::string const& get_name() const override;
	virtual Dynamics get_dynamics() const override;
	virtual std::map<std::string, Quantity> get_properties() const override;
	virtual std::map<std::string, Quantity> get_initial_values() const override;

	virtual std::unique_ptr<Component> copy() const override;
	virtual std::unique_ptr<Component> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(Component const& other) const override;
};

} // namespace sinter::dynamics
