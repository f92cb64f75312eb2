#pragma once
#include "sinter/common/property.h"
#include "sinter/common/property_holder.h"
#include <map>
#include <stdexcept>
#include <utility>
#include <boost/iterator/transform_iterator.hpp>

namespace sinter::common {

/**
 * Map storing potentially polymorphic values.
 * Elements are never silently overwritten on insertion, adding a value for a key already present
 * is an error.
 * @tparam KeyT Key type
 * @tparam ValueT Value type required to be derived from a Property
 */
template <typename KeyT, typename ValueT>
struct Map
{
	typedef KeyT Key;
	typedef ValueT Value;
	typedef std::map<Key, PropertyHolder<Value>> Backend;

	Map() = default;

	/**
	 * Add element to map.
	 * @param key Key for which to add value
	 * @param value Value to add
	 * @throws NameCollisionError On map already containing entry for given key
	 */
	void add(Key const& key, Value const& value);

	/**
	 * Add element to map.
	 * @param key Key for which to add value
	 * @param value Value to add
	 * @throws NameCollisionError On map already containing entry for given key
	 */
	void add(Key const& key, Value&& value);

	/**
	 * Move all elements of other map into this map.
	 * No element is moved if any key is present in both maps.
	 * @param other Map to merge
	 * @throws NameCollisionError On a key being present in both maps
	 */
	void merge(Map&& other);

	/**
	 * Get value of element present in map.
	 * @param key Key for which to get value
	 * @return Value to get
	 * @throws std::out_of_range On no element for key present in map
	 */
	Value const& get(Key const& key) const;

	/**
	 * Set value of element present in map.
	 * @param key Key for which to set value
	 * @param value Value to set
	 * @throws std::out_of_range On no element for key present in map
	 */
	void set(Key const& key, Value const& value);

	/**
	 * Erase element for given key in map.
	 * @param key Key to erase element for
	 */
	void erase(Key const& key);

	bool contains(Key const& key) const;

	size_t size() const;

	bool empty() const;

	/** Iteration yields pairs of key and dereferenced value. */
	struct Dereference
	{
		std::pair<Key const&, Value const&> operator()(
		    typename Backend::value_type const& entry) const
		{
			if (!entry.second) {
				throw std::logic_error("Unexpected access to moved-from map entry.");
			}
			return {entry.first, *entry.second};
		}
	};

	typedef boost::transform_iterator<Dereference, typename Backend::const_iterator> ConstIterator;

	ConstIterator begin() const;
	ConstIterator end() const;

	bool operator==(Map const& other) const = default;
	bool operator!=(Map const& other) const = default;

private:
	static_assert(std::is_base_of_v<Property<Value>, Value>);
	Backend m_values;
};

} // namespace sinter::common

#include "sinter/common/map.tcc"
