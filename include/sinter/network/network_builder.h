#pragma once
#include "sinter/network/network.h"
#include "hate/visibility.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace log4cxx {
class Logger;
typedef std::shared_ptr<Logger> LoggerPtr;
} // namespace log4cxx

namespace sinter::network {

class SYMBOL_VISIBLE NetworkBuilder
{
public:
	/**
	 * Add population.
	 * @param population Population to add
	 * @throws std::runtime_error On population not being valid
	 * @throws NameCollisionError On name already being used in the network
	 */
	void add(Population const& population) SYMBOL_VISIBLE;

	/**
	 * Add selection of already added populations.
	 * @param selection Selection to add
	 * @throws StructuralError On selection being empty or referring to unknown populations
	 * @throws NameCollisionError On name already being used in the network
	 */
	void add(Selection const& selection) SYMBOL_VISIBLE;

	/**
	 * Add projection between already added populations or selections.
	 * Port connections are required to only use the roles of the projection description, i.e.
	 * pre, post, response and plasticity if plasticity dynamics is present.
	 * @param projection Projection to add
	 * @throws StructuralError On source or target being unknown
	 * @throws InvalidRoleError On port connection using a role the projection doesn't feature
	 * @throws NameCollisionError On name already being used in the network
	 */
	void add(Projection const& projection) SYMBOL_VISIBLE;

	NetworkBuilder() SYMBOL_VISIBLE;

	std::shared_ptr<Network> done() SYMBOL_VISIBLE;

private:
	void check_unused(std::string const& name) const;

	std::map<std::string, Population> m_populations;
	std::map<std::string, Selection> m_selections;
	std::map<std::string, Projection> m_projections;
	std::chrono::microseconds m_duration;
	log4cxx::LoggerPtr m_logger;
};

} // namespace sinter::network
