#pragma once
#include "hate/visibility.h"
#include <iosfwd>
#include <memory>
#include <typeinfo>

namespace sinter::common {

/** Object printable through a reference to its base. */
struct SYMBOL_VISIBLE Printable
{
	virtual ~Printable();

	friend std::ostream& operator<<(std::ostream& os, Printable const& printable) SYMBOL_VISIBLE;

protected:
	virtual std::ostream& print(std::ostream& os) const = 0;
};

/**
 * Object which can be copied through a pointer to its base.
 * @tparam T Base class the copy is returned as
 */
template <typename T>
struct SYMBOL_VISIBLE Copyable
{
	virtual std::unique_ptr<T> copy() const = 0;
};

/**
 * Object which can be moved through a pointer to its base.
 * @tparam T Base class the moved-to object is returned as
 */
template <typename T>
struct SYMBOL_VISIBLE Movable
{
	virtual std::unique_ptr<T> move() = 0;
};

/**
 * Object which is equality comparable through a reference to its base.
 * Objects of differing dynamic type always compare unequal.
 * @tparam T Base class
 */
template <typename T>
struct SYMBOL_VISIBLE EqualityComparable
{
	bool operator==(EqualityComparable const& other) const
	{
		return typeid(*this) == typeid(other) && is_equal_to(static_cast<T const&>(other));
	}

	bool operator!=(EqualityComparable const& other) const
	{
		return !(*this == other);
	}

protected:
	/**
	 * Check whether this instance is equal to the other object.
	 * Only called after the dynamic types were found to match.
	 * @param other Other object of same dynamic type
	 */
	virtual bool is_equal_to(T const& other) const = 0;
};

/**
 * Polymorphic model element, which we define to be
 *  - copyable
 *  - movable
 *  - printable
 *  - equality-comparable
 * Values, connectivity rules, components and the flattened outputs derive from it.
 */
template <typename Derived>
struct SYMBOL_VISIBLE Property
    : public Copyable<Derived>
    , public Movable<Derived>
    , public Printable
    , public EqualityComparable<Derived>
{};

} // namespace sinter::common
