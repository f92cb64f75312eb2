#pragma once
#include "sinter/common/property.h"
#include "sinter/common/property_holder.h"
#include "hate/visibility.h"
#include <iosfwd>
#include <memory>
#include <utility>
#include <vector>

namespace sinter::network {

/**
 * Rule describing which source instances connect to which target instances.
 * Sampling of the rule into concrete connections is left to the back-end.
 */
struct SYMBOL_VISIBLE ConnectivityRule : public common::Property<ConnectivityRule>
{
	/**
	 * Get rule with sender and receiver sets swapped.
	 * Rules without structural inverse are wrapped into InverseConnectivity.
	 */
	virtual std::unique_ptr<ConnectivityRule> inverse() const SYMBOL_VISIBLE;
};


/** Every source instance connects to every target instance. */
struct SYMBOL_VISIBLE AllToAll final : public ConnectivityRule
{
	AllToAll() = default;

	virtual std::unique_ptr<ConnectivityRule> inverse() const override;

	virtual std::unique_ptr<ConnectivityRule> copy() const override;
	virtual std::unique_ptr<ConnectivityRule> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectivityRule const& other) const override;
};


/** Source instance i connects to target instance i. */
struct SYMBOL_VISIBLE OneToOne final : public ConnectivityRule
{
	OneToOne() = default;

	virtual std::unique_ptr<ConnectivityRule> inverse() const override;

	virtual std::unique_ptr<ConnectivityRule> copy() const override;
	virtual std::unique_ptr<ConnectivityRule> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectivityRule const& other) const override;
};


/** Every pair of source and target instance is connected with given probability. */
struct SYMBOL_VISIBLE FixedProbability final : public ConnectivityRule
{
	double probability;

	/**
	 * Construct rule.
	 * @param probability Connection probability
	 * @throws std::invalid_argument On probability not in [0, 1]
	 */
	explicit FixedProbability(double probability) SYMBOL_VISIBLE;

	virtual std::unique_ptr<ConnectivityRule> copy() const override;
	virtual std::unique_ptr<ConnectivityRule> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectivityRule const& other) const override;
};


/** Explicitly enumerated (source index, target index) pairs. */
struct SYMBOL_VISIBLE ExplicitConnectionList final : public ConnectivityRule
{
	typedef std::pair<size_t, size_t> Connection;

	std::vector<Connection> connections;

	explicit ExplicitConnectionList(std::vector<Connection> connections) SYMBOL_VISIBLE;

	virtual std::unique_ptr<ConnectivityRule> inverse() const override;

	virtual std::unique_ptr<ConnectivityRule> copy() const override;
	virtual std::unique_ptr<ConnectivityRule> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectivityRule const& other) const override;
};


/**
 * Wrapped rule with sender and receiver sets swapped.
 */
struct SYMBOL_VISIBLE InverseConnectivity final : public ConnectivityRule
{
	common::PropertyHolder<ConnectivityRule> rule;

	explicit InverseConnectivity(ConnectivityRule const& rule) SYMBOL_VISIBLE;

	/**
	 * Get the wrapped rule.
	 */
	virtual std::unique_ptr<ConnectivityRule> inverse() const override;

	virtual std::unique_ptr<ConnectivityRule> copy() const override;
	virtual std::unique_ptr<ConnectivityRule> move() override;

protected:
	virtual std::ostream& print(std::ostream& os) const override;
	virtual bool is_equal_to(ConnectivityRule const& other) const override;
};

} // namespace sinter::network
