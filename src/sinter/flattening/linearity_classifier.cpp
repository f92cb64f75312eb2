#include "sinter/flattening/linearity_classifier.h"

#include "hate/timer.h"
#include <ostream>
#include <log4cxx/logger.h>

namespace sinter::flattening {

std::ostream& operator<<(std::ostream& os, Embeddable const& value)
{
	return os << "Embeddable(" << value.dynamics.name << ")";
}

std::ostream& operator<<(std::ostream& os, Unflattenable const& value)
{
	return os << "Unflattenable(" << value.reason << ")";
}

LinearityClassification classify_linearity(dynamics::Component const& synapse)
{
	auto logger = log4cxx::Logger::getLogger("sinter.classify_linearity");
	hate::Timer timer;

	auto dynamics = synapse.get_dynamics();
	auto const nonlinearity = dynamics.get_nonlinearity();

	LOG4CXX_TRACE(
	    logger, "classify_linearity(): Classified synapse(" << synapse.get_name() << ") in "
	                                                        << timer.print() << ".");
	if (nonlinearity) {
		LOG4CXX_DEBUG(
		    logger, "classify_linearity(): Synapse(" << synapse.get_name()
		                                             << ") is not linear: " << *nonlinearity);
		return Unflattenable{*nonlinearity};
	}
	LOG4CXX_DEBUG(
	    logger, "classify_linearity(): Synapse(" << synapse.get_name() << ") is linear.");
	return Embeddable{std::move(dynamics)};
}

} // namespace sinter::flattening
