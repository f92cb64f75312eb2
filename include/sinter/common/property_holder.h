#pragma once
#include "sinter/common/property.h"
#include <iosfwd>
#include <memory>
#include <type_traits>

namespace sinter::common {

/**
 * Value-semantic holder of a polymorphic property.
 * It is copyable, value-equality comparable, printable and provides checked access to the stored
 * object.
 * @tparam T Base type of object to store
 */
template <typename T>
struct PropertyHolder
{
	PropertyHolder() = default;
	PropertyHolder(T const& value);
	PropertyHolder(T&& value);
	PropertyHolder(std::unique_ptr<T> value);
	PropertyHolder(PropertyHolder const& other);
	PropertyHolder(PropertyHolder&& other) = default;

	PropertyHolder& operator=(PropertyHolder const& other);
	PropertyHolder& operator=(PropertyHolder&& other) = default;
	PropertyHolder& operator=(T const& other);
	PropertyHolder& operator=(T&& other);

	/**
	 * Get whether object is present.
	 */
	explicit operator bool() const;

	/**
	 * Get reference to stored object.
	 * @throws std::runtime_error On no object being present
	 */
	T& operator*() const;

	/**
	 * Get pointer to stored object.
	 * @throws std::runtime_error On no object being present
	 */
	T* operator->() const;

	bool operator==(PropertyHolder const& other) const;
	bool operator!=(PropertyHolder const& other) const;

private:
	std::unique_ptr<T> m_backend;

	static_assert(std::is_base_of_v<Property<T>, T>);
};

template <typename T>
std::ostream& operator<<(std::ostream& os, PropertyHolder<T> const& value);

} // namespace sinter::common

#include "sinter/common/property_holder.tcc"
