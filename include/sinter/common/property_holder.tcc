#pragma once
#include "sinter/common/property_holder.h"
#include <ostream>
#include <stdexcept>

namespace sinter::common {

template <typename T>
PropertyHolder<T>::PropertyHolder(T const& value) : m_backend(value.copy())
{}

template <typename T>
PropertyHolder<T>::PropertyHolder(T&& value) : m_backend(value.move())
{}

template <typename T>
PropertyHolder<T>::PropertyHolder(std::unique_ptr<T> value) : m_backend(std::move(value))
{}

template <typename T>
PropertyHolder<T>::PropertyHolder(PropertyHolder const& other) :
    m_backend(other ? other->copy() : nullptr)
{}

template <typename T>
PropertyHolder<T>& PropertyHolder<T>::operator=(PropertyHolder const& other)
{
	if (this != &other) {
		m_backend = other.m_backend ? other.m_backend->copy() : nullptr;
	}
	return *this;
}

template <typename T>
PropertyHolder<T>& PropertyHolder<T>::operator=(T const& other)
{
	m_backend = other.copy();
	return *this;
}

template <typename T>
PropertyHolder<T>& PropertyHolder<T>::operator=(T&& other)
{
	m_backend = other.move();
	return *this;
}

template <typename T>
PropertyHolder<T>::operator bool() const
{
	return static_cast<bool>(m_backend);
}

template <typename T>
T& PropertyHolder<T>::operator*() const
{
	if (!m_backend) {
		throw std::runtime_error("Trying to dereference unset property holder.");
	}
	return *m_backend;
}

template <typename T>
T* PropertyHolder<T>::operator->() const
{
	if (!m_backend) {
		throw std::runtime_error("Trying to dereference unset property holder.");
	}
	return m_backend.get();
}

template <typename T>
bool PropertyHolder<T>::operator==(PropertyHolder const& other) const
{
	if (static_cast<bool>(m_backend) != static_cast<bool>(other.m_backend)) {
		return false;
	}
	return !m_backend || (*m_backend == *(other.m_backend));
}

template <typename T>
bool PropertyHolder<T>::operator!=(PropertyHolder const& other) const
{
	return !(*this == other);
}

template <typename T>
std::ostream& operator<<(std::ostream& os, PropertyHolder<T> const& value)
{
	if (!value) {
		return os << "unset";
	}
	return os << *value;
}

} // namespace sinter::common
