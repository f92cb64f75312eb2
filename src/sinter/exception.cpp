#include "sinter/exception.h"

namespace sinter {

StructuralError::StructuralError(std::string const& message) : m_message(message) {}

const char* StructuralError::what() const noexcept
{
	return m_message.c_str();
}

InvalidRoleError::InvalidRoleError(std::string const& message) : StructuralError(message) {}

NamespaceCollisionError::NamespaceCollisionError(std::string const& message) :
    StructuralError(message)
{}

ReservedNameError::ReservedNameError(std::string const& message) : StructuralError(message) {}

NameCollisionError::NameCollisionError(std::string const& message) : StructuralError(message) {}

} // namespace sinter
