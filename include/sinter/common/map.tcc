#pragma once
#include "sinter/common/map.h"
#include "sinter/exception.h"
#include <sstream>
#include <stdexcept>

namespace sinter::common {

template <typename Key, typename Value>
void Map<Key, Value>::add(Key const& key, Value const& value)
{
	if (m_values.contains(key)) {
		std::stringstream ss;
		ss << "Map already contains entry for key " << key << ".";
		throw NameCollisionError(ss.str());
	}
	m_values.emplace(key, value);
}

template <typename Key, typename Value>
void Map<Key, Value>::add(Key const& key, Value&& value)
{
	if (m_values.contains(key)) {
		std::stringstream ss;
		ss << "Map already contains entry for key " << key << ".";
		throw NameCollisionError(ss.str());
	}
	m_values.emplace(key, std::move(value));
}

template <typename Key, typename Value>
void Map<Key, Value>::merge(Map&& other)
{
	for (auto const& [key, _] : other.m_values) {
		if (m_values.contains(key)) {
			std::stringstream ss;
			ss << "Map already contains entry for key " << key << ".";
			throw NameCollisionError(ss.str());
		}
	}
	m_values.merge(other.m_values);
}

template <typename Key, typename Value>
Value const& Map<Key, Value>::get(Key const& key) const
{
	if (!m_values.contains(key)) {
		std::stringstream ss;
		ss << "Map doesn't contain entry for key " << key << ".";
		throw std::out_of_range(ss.str());
	}
	return *m_values.at(key);
}

template <typename Key, typename Value>
void Map<Key, Value>::set(Key const& key, Value const& value)
{
	if (!m_values.contains(key)) {
		std::stringstream ss;
		ss << "Map doesn't contain entry for key " << key << ".";
		throw std::out_of_range(ss.str());
	}
	m_values.at(key) = value;
}

template <typename Key, typename Value>
void Map<Key, Value>::erase(Key const& key)
{
	m_values.erase(key);
}

template <typename Key, typename Value>
bool Map<Key, Value>::contains(Key const& key) const
{
	return m_values.contains(key);
}

template <typename Key, typename Value>
size_t Map<Key, Value>::size() const
{
	return m_values.size();
}

template <typename Key, typename Value>
bool Map<Key, Value>::empty() const
{
	return m_values.empty();
}

template <typename Key, typename Value>
typename Map<Key, Value>::ConstIterator Map<Key, Value>::begin() const
{
	return ConstIterator(m_values.begin());
}

template <typename Key, typename Value>
typename Map<Key, Value>::ConstIterator Map<Key, Value>::end() const
{
	return ConstIterator(m_values.end());
}

} // namespace sinter::common
