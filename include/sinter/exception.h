#pragma once
#include "hate/visibility.h"
#include <exception>
#include <string>

namespace sinter {

/**
 * Exception describing a structurally invalid network or component.
 * Structural errors are fatal and abort flattening.
 */
struct SYMBOL_VISIBLE StructuralError : public std::exception
{
	/**
	 * Construct from cause message.
	 * @param message Exception cause
	 */
	explicit StructuralError(std::string const& message);

	/**
	 * Get exception cause.
	 * @return String describing cause of exception
	 */
	virtual const char* what() const noexcept override;

private:
	std::string m_message;
};

/**
 * Port connection refers to a role which is not available in its context.
 */
struct SYMBOL_VISIBLE InvalidRoleError : public StructuralError
{
	explicit InvalidRoleError(std::string const& message);
};

/**
 * Namespaced names of sub-components would become ambiguous.
 */
struct SYMBOL_VISIBLE NamespaceCollisionError : public StructuralError
{
	explicit NamespaceCollisionError(std::string const& message);
};

/**
 * Element uses the name reserved for the cell dynamics.
 */
struct SYMBOL_VISIBLE ReservedNameError : public StructuralError
{
	explicit ReservedNameError(std::string const& message);
};

/**
 * Element name is already in use.
 */
struct SYMBOL_VISIBLE NameCollisionError : public StructuralError
{
	explicit NameCollisionError(std::string const& message);
};

} // namespace sinter
