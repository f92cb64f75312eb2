#include "sinter/network/network_builder.h"

#include "sinter/exception.h"
#include "hate/timer.h"
#include <sstream>
#include <stdexcept>
#include <log4cxx/logger.h>

namespace sinter::network {

NetworkBuilder::NetworkBuilder() :
    m_populations(),
    m_selections(),
    m_projections(),
    m_duration(0),
    m_logger(log4cxx::Logger::getLogger("sinter.network.NetworkBuilder"))
{}

void NetworkBuilder::check_unused(std::string const& name) const
{
	if (m_populations.contains(name) || m_selections.contains(name) ||
	    m_projections.contains(name)) {
		LOG4CXX_ERROR(m_logger, "add(): Name(" << name << ") already used in network.");
		throw NameCollisionError("Name(" + name + ") already used in network.");
	}
}

void NetworkBuilder::add(Population const& population)
{
	hate::Timer timer;
	if (!population.valid()) {
		throw std::runtime_error("Population(" + population.name + ") is not valid.");
	}
	check_unused(population.name);
	m_populations.emplace(population.name, population);
	LOG4CXX_TRACE(
	    m_logger,
	    "add(): Added population(" << population.name << ") in " << timer.print() << ".");
	m_duration += std::chrono::microseconds(timer.get_us());
}

void NetworkBuilder::add(Selection const& selection)
{
	hate::Timer timer;
	if (selection.populations.empty()) {
		throw StructuralError("Selection(" + selection.name + ") is empty.");
	}
	for (auto const& population : selection.populations) {
		if (!m_populations.contains(population)) {
			throw StructuralError(
			    "Selection(" + selection.name + ") refers to unknown population(" + population +
			    ").");
		}
	}
	check_unused(selection.name);
	m_selections.emplace(selection.name, selection);
	LOG4CXX_TRACE(
	    m_logger, "add(): Added selection(" << selection.name << ") in " << timer.print() << ".");
	m_duration += std::chrono::microseconds(timer.get_us());
}

void NetworkBuilder::add(Projection const& projection)
{
	hate::Timer timer;
	for (auto const& reference : {projection.pre, projection.post}) {
		if (!m_populations.contains(reference) && !m_selections.contains(reference)) {
			throw StructuralError(
			    "Projection(" + projection.name + ") refers to unknown population or selection(" +
			    reference + ").");
		}
	}
	for (auto const& port_connection : projection.port_connections) {
		if (!projection.has_role(port_connection.sender_role) ||
		    !projection.has_role(port_connection.receiver_role)) {
			std::stringstream ss;
			ss << port_connection << " of projection(" << projection.name
			   << ") uses role not present in projection.";
			LOG4CXX_ERROR(m_logger, "add(): " << ss.str());
			throw InvalidRoleError(ss.str());
		}
	}
	check_unused(projection.name);
	m_projections.emplace(projection.name, projection);
	LOG4CXX_TRACE(
	    m_logger,
	    "add(): Added projection(" << projection.name << ") in " << timer.print() << ".");
	m_duration += std::chrono::microseconds(timer.get_us());
}

std::shared_ptr<Network> NetworkBuilder::done()
{
	LOG4CXX_TRACE(m_logger, "done(): Finished building network.");
	auto const ret = std::make_shared<Network>(
	    std::move(m_populations), std::move(m_selections), std::move(m_projections), m_duration);
	m_populations.clear();
	m_selections.clear();
	m_projections.clear();
	m_duration = std::chrono::microseconds(0);
	LOG4CXX_DEBUG(m_logger, "done(): " << *ret);
	return ret;
}

} // namespace sinter::network
