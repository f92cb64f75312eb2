#include "sinter/common/namespace.h"

#include <stdexcept>

namespace sinter::common {

std::string append_namespace(std::string const& name, std::string const& ns)
{
	return name + namespace_separator + ns;
}

std::pair<std::string, std::string> split_namespace(std::string const& name)
{
	std::string const separator(namespace_separator);
	auto const position = name.rfind(separator);
	if (position == std::string::npos) {
		throw std::invalid_argument("Name(" + name + ") is not namespaced.");
	}
	return {name.substr(position + separator.size()), name.substr(0, position)};
}

bool is_namespaced(std::string const& name)
{
	return name.find(namespace_separator) != std::string::npos;
}

} // namespace sinter::common
