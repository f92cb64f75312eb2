#pragma once
#include "hate/visibility.h"
#include <string>
#include <utility>

namespace sinter::common {

/** Separator between a name and the namespace it is placed in. */
inline constexpr char namespace_separator[] = "__";

/**
 * Place name in namespace, e.g. append_namespace("spike", "psr") == "spike__psr".
 * @param name Name to place in namespace
 * @param ns Namespace, typically the name of the owning sub-component
 */
std::string append_namespace(std::string const& name, std::string const& ns) SYMBOL_VISIBLE;

/**
 * Split namespaced name at the last separator.
 * @param name Namespaced name
 * @return Pair of namespace and name within it
 * @throws std::invalid_argument On name not containing the separator
 */
std::pair<std::string, std::string> split_namespace(std::string const& name) SYMBOL_VISIBLE;

/**
 * Get whether name contains the namespace separator.
 */
bool is_namespaced(std::string const& name) SYMBOL_VISIBLE;

} // namespace sinter::common
