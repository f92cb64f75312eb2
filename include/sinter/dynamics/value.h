#pragma once
#include "sinter/common/property.h"
#include "sinter/common/property_holder.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sinter::dynamics {

/**
 * Value assigned to a property or initial state of a dynamics instance.
 */
struct SYMBOL_VISIBLE Value : public common::Property<Value>
{
	/**
	 * Get whether the value is one constant shared by all instances.
	 * Properties with a non-single value vary between instances.
	 */
	virtual bool is_single() const = 0;
};


/** Constant value shared by all instances. */
struct SYMBOL_VISIBLE SingleValue final : public Value
{
	double value;

	explicit SingleValue(double value) SYMBOL_VISIBLE;

	virtual bool is_single() const override;

	virtual std::unique_ptr<Value> copy() const override;
	virtual std::unique_ptr<Value> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(Value const& other) const override;
};


/** Explicit value per instance. */
struct SYMBOL_VISIBLE ArrayValue final : public Value
{
	std::vector<double> values;

	explicit ArrayValue(std::vector<double> values) SYMBOL_VISIBLE;

	virtual bool is_single() const override;

	virtual std::unique_ptr<Value> copy() const override;
	virtual std::unique_ptr<Value> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(Value const& other) const override;
};


/**
 * Value drawn per instance from a random distribution.
 * Drawing is performed by the simulator back-end.
 */
struct SYMBOL_VISIBLE RandomDistributionValue final : public Value
{
	/** Distribution identifier, e.g. "normal". */
	std::string distribution;
	/** Distribution parameters by name. */
	std::map<std::string, double> parameters;

	RandomDistributionValue(std::string distribution, std::map<std::string, double> parameters)
	    SYMBOL_VISIBLE;

	virtual bool is_single() const override;

	virtual std::unique_ptr<Value> copy() const override;
	virtual std::unique_ptr<Value> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(Value const& other) const override;
};


/**
 * Value with units.
 * Units are carried verbatim, conversion is up to the back-end.
 */
struct SYMBOL_VISIBLE Quantity
{
	common::PropertyHolder<Value> value;
	std::string units;

	Quantity() = default;
	Quantity(Value const& value, std::string units) SYMBOL_VISIBLE;

	/**
	 * Get whether the quantity's value is shared by all instances.
	 * @throws std::runtime_error On no value being set
	 */
	bool is_single() const SYMBOL_VISIBLE;

	bool operator==(Quantity const& other) const SYMBOL_VISIBLE;
	bool operator!=(Quantity const& other) const SYMBOL_VISIBLE;

	friend std::ostream& operator<<(std::ostream& os, Quantity const& quantity) SYMBOL_VISIBLE;
};

} // namespace sinter::dynamics
