#pragma once

#include <iterator>

template <class A, class... Option>
constexpr bool is_one_of(A&& val, Option&&... option) {
	return ((val == option) or ...);
}

template <class T, class V>
constexpr bool contains(T&& collection, V&& val) {
	for (auto const& elem : collection) {
		if (elem == val)
			return true;
	}

	return false;
}

// Returns a pointer to the first element whose .source equals @p key or
// nullptr if there is none
template <class T, class K>
constexpr auto find_by_source(T&& collection, K&& key)
   -> decltype(&*std::begin(collection)) {
	for (auto const& elem : collection) {
		if (elem.source == key)
			return &elem;
	}

	return nullptr;
}
