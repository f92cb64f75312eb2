#include "sinter/flattening/connection_property_set.h"

#include "sinter/common/namespace.h"
#include "hate/join.h"
#include "hate/timer.h"
#include <algorithm>
#include <iterator>
#include <ostream>
#include <set>
#include <log4cxx/logger.h>

namespace sinter::flattening {

std::ostream& operator<<(std::ostream& os, ConnectionPropertySet const& value)
{
	os << "ConnectionPropertySet(" << value.port << ": ";
	bool first = true;
	for (auto const& [name, quantity] : value.properties) {
		if (!first) {
			os << ", ";
		}
		os << name << " = " << quantity;
		first = false;
	}
	return os << ")";
}

ConnectionPropertyExtraction extract_connection_property_sets(
    dynamics::Component const& synapse, std::string const& ns)
{
	auto logger = log4cxx::Logger::getLogger("sinter.extract_connection_property_sets");
	hate::Timer timer;

	auto const dynamics = synapse.get_dynamics();
	auto const properties = synapse.get_properties();

	std::set<std::string> varying;
	for (auto const& [name, quantity] : properties) {
		if (dynamics.has_parameter(name) && !quantity.is_single()) {
			varying.insert(name);
		}
	}

	std::vector<dynamics::Expression> continuous;
	for (auto const& time_derivative : dynamics.get_time_derivatives()) {
		continuous.push_back(time_derivative.rhs);
	}
	for (auto const& on_condition : dynamics.get_on_conditions()) {
		continuous.push_back(on_condition.trigger);
		for (auto const& state_assignment : on_condition.state_assignments) {
			continuous.push_back(state_assignment.rhs);
		}
	}
	auto const forbidden = dynamics.required_for(continuous).parameters;

	std::vector<std::string> conflicting;
	std::set_intersection(
	    varying.begin(), varying.end(), forbidden.begin(), forbidden.end(),
	    std::back_inserter(conflicting));
	if (!conflicting.empty()) {
		auto const reason = "Properties(" + hate::join_string(conflicting, ", ") +
		                    ") varying between instances of synapse(" + synapse.get_name() +
		                    ") are required by continuous dynamics.";
		LOG4CXX_DEBUG(logger, "extract_connection_property_sets(): " << reason);
		return Unflattenable{reason};
	}

	std::map<std::string, std::set<std::string>> port_properties;
	for (auto const& on_event : dynamics.get_on_events()) {
		std::vector<dynamics::Expression> assigned;
		for (auto const& state_assignment : on_event.state_assignments) {
			assigned.push_back(state_assignment.rhs);
		}
		auto const required = dynamics.required_for(assigned).parameters;
		auto& set = port_properties[on_event.src_port];
		std::set_intersection(
		    varying.begin(), varying.end(), required.begin(), required.end(),
		    std::inserter(set, set.end()));
	}

	std::vector<ConnectionPropertySet> connection_property_sets;
	for (auto const& [port, names] : port_properties) {
		if (names.empty()) {
			continue;
		}
		ConnectionPropertySet connection_property_set{common::append_namespace(port, ns), {}};
		for (auto const& name : names) {
			connection_property_set.properties.emplace(
			    common::append_namespace(name, ns), properties.at(name));
		}
		connection_property_sets.push_back(std::move(connection_property_set));
	}

	LOG4CXX_TRACE(
	    logger, "extract_connection_property_sets(): Extracted "
	                << connection_property_sets.size() << " property sets of synapse("
	                << synapse.get_name() << ") in " << timer.print() << ".");
	return connection_property_sets;
}

} // namespace sinter::flattening
