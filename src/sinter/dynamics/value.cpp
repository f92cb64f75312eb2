#include "sinter/dynamics/value.h"

#include "hate/join.h"
#include <ostream>

namespace sinter::dynamics {

SingleValue::SingleValue(double const value) : value(value) {}

bool SingleValue::is_single() const
{
	return true;
}

std::unique_ptr<Value> SingleValue::copy() const
{
	return std::make_unique<SingleValue>(*this);
}

std::unique_ptr<Value> SingleValue::move()
{
	return std::make_unique<SingleValue>(std::move(*this));
}

std::ostream& SingleValue::print(std::ostream& os) const
{
	return os << "SingleValue(" << value << ")";
}

bool SingleValue::is_equal_to(Value const& other) const
{
	return value == static_cast<SingleValue const&>(other).value;
}


ArrayValue::ArrayValue(std::vector<double> values) : values(std::move(values)) {}

bool ArrayValue::is_single() const
{
	return false;
}

std::unique_ptr<Value> ArrayValue::copy() const
{
	return std::make_unique<ArrayValue>(*this);
}

std::unique_ptr<Value> ArrayValue::move()
{
	return std::make_unique<ArrayValue>(std::move(*this));
}

std::ostream& ArrayValue::print(std::ostream& os) const
{
	return os << "ArrayValue(" << hate::join(values, ", ") << ")";
}

bool ArrayValue::is_equal_to(Value const& other) const
{
	return values == static_cast<ArrayValue const&>(other).values;
}


RandomDistributionValue::RandomDistributionValue(
    std::string distribution, std::map<std::string, double> parameters) :
    distribution(std::move(distribution)), parameters(std::move(parameters))
{}

bool RandomDistributionValue::is_single() const
{
	return false;
}

std::unique_ptr<Value> RandomDistributionValue::copy() const
{
	return std::make_unique<RandomDistributionValue>(*this);
}

std::unique_ptr<Value> RandomDistributionValue::move()
{
	return std::make_unique<RandomDistributionValue>(std::move(*this));
}

std::ostream& RandomDistributionValue::print(std::ostream& os) const
{
	os << "RandomDistributionValue(" << distribution;
	for (auto const& [name, parameter] : parameters) {
		os << ", " << name << ": " << parameter;
	}
	return os << ")";
}

bool RandomDistributionValue::is_equal_to(Value const& other) const
{
	auto const& o = static_cast<RandomDistributionValue const&>(other);
	return distribution == o.distribution && parameters == o.parameters;
}


Quantity::Quantity(Value const& value, std::string units) : value(value), units(std::move(units))
{}

bool Quantity::is_single() const
{
	return value->is_single();
}

bool Quantity::operator==(Quantity const& other) const
{
	return value == other.value && units == other.units;
}

bool Quantity::operator!=(Quantity const& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, Quantity const& quantity)
{
	return os << "Quantity(" << quantity.value << " " << quantity.units << ")";
}

} // namespace sinter::dynamics
