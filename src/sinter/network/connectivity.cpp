#include "sinter/network/connectivity.h"

#include "hate/join.h"
#include <ostream>
#include <stdexcept>

namespace sinter::network {

std::unique_ptr<ConnectivityRule> ConnectivityRule::inverse() const
{
	return std::make_unique<InverseConnectivity>(*this);
}


std::unique_ptr<ConnectivityRule> AllToAll::inverse() const
{
	return copy();
}

std::unique_ptr<ConnectivityRule> AllToAll::copy() const
{
	return std::make_unique<AllToAll>(*this);
}

std::unique_ptr<ConnectivityRule> AllToAll::move()
{
	return std::make_unique<AllToAll>(std::move(*this));
}

std::ostream& AllToAll::print(std::ostream& os) const
{
	return os << "AllToAll()";
}

bool AllToAll::is_equal_to(ConnectivityRule const&) const
{
	return true;
}


std::unique_ptr<ConnectivityRule> OneToOne::inverse() const
{
	return copy();
}

std::unique_ptr<ConnectivityRule> OneToOne::copy() const
{
	return std::make_unique<OneToOne>(*this);
}

std::unique_ptr<ConnectivityRule> OneToOne::move()
{
	return std::make_unique<OneToOne>(std::move(*this));
}

std::ostream& OneToOne::print(std::ostream& os) const
{
	return os << "OneToOne()";
}

bool OneToOne::is_equal_to(ConnectivityRule const&) const
{
	return true;
}


FixedProbability::FixedProbability(double const probability) : probability(probability)
{
	if (probability < 0. || probability > 1.) {
		throw std::invalid_argument(
		    "Connection probability(" + std::to_string(probability) + ") not in [0, 1].");
	}
}

std::unique_ptr<ConnectivityRule> FixedProbability::copy() const
{
	return std::make_unique<FixedProbability>(*this);
}

std::unique_ptr<ConnectivityRule> FixedProbability::move()
{
	return std::make_unique<FixedProbability>(std::move(*this));
}

std::ostream& FixedProbability::print(std::ostream& os) const
{
	return os << "FixedProbability(" << probability << ")";
}

bool FixedProbability::is_equal_to(ConnectivityRule const& other) const
{
	return probability == static_cast<FixedProbability const&>(other).probability;
}


ExplicitConnectionList::ExplicitConnectionList(std::vector<Connection> connections) :
    connections(std::move(connections))
{}

std::unique_ptr<ConnectivityRule> ExplicitConnectionList::inverse() const
{
	std::vector<Connection> swapped;
	swapped.reserve(connections.size());
	for (auto const& [source, target] : connections) {
		swapped.emplace_back(target, source);
	}
	return std::make_unique<ExplicitConnectionList>(std::move(swapped));
}

std::unique_ptr<ConnectivityRule> ExplicitConnectionList::copy() const
{
	return std::make_unique<ExplicitConnectionList>(*this);
}

std::unique_ptr<ConnectivityRule> ExplicitConnectionList::move()
{
	return std::make_unique<ExplicitConnectionList>(std::move(*this));
}

std::ostream& ExplicitConnectionList::print(std::ostream& os) const
{
	os << "ExplicitConnectionList(";
	std::vector<std::string> pairs;
	for (auto const& [source, target] : connections) {
		pairs.push_back("(" + std::to_string(source) + ", " + std::to_string(target) + ")");
	}
	return os << hate::join(pairs, ", ") << ")";
}

bool ExplicitConnectionList::is_equal_to(ConnectivityRule const& other) const
{
	return connections == static_cast<ExplicitConnectionList const&>(other).connections;
}


InverseConnectivity::InverseConnectivity(ConnectivityRule const& rule) : rule(rule) {}

std::unique_ptr<ConnectivityRule> InverseConnectivity::inverse() const
{
	return rule->copy();
}

std::unique_ptr<ConnectivityRule> InverseConnectivity::copy() const
{
	return std::make_unique<InverseConnectivity>(*this);
}

std::unique_ptr<ConnectivityRule> InverseConnectivity::move()
{
	return std::make_unique<InverseConnectivity>(std::move(*this));
}

std::ostream& InverseConnectivity::print(std::ostream& os) const
{
	return os << "InverseConnectivity(" << rule << ")";
}

bool InverseConnectivity::is_equal_to(ConnectivityRule const& other) const
{
	return rule == static_cast<InverseConnectivity const&>(other).rule;
}

} // namespace sinter::network
