#pragma once

#include <algorithm>
#include <string>
#include <string_view>

inline bool has_prefix(const std::string_view& str,
                       const std::string_view& prefix) noexcept {
	return (str.compare(0, prefix.size(), prefix) == 0);
}

template <class... T>
inline bool has_one_of_prefixes(const std::string_view& str,
                                T&&... prefixes) noexcept {
	return (... or has_prefix(str, std::forward<T>(prefixes)));
}

inline bool has_suffix(const std::string_view& str,
                       const std::string_view& suffix) noexcept {
	return (str.size() >= suffix.size() and
	        str.compare(str.size() - suffix.size(), suffix.size(), suffix) ==
	           0);
}

inline bool is_blank(char c) noexcept {
	return (c == ' ' or c == '\t' or c == '\n' or c == '\r');
}

inline std::string_view trim(std::string_view str) noexcept {
	while (not str.empty() and is_blank(str.front()))
		str.remove_prefix(1);
	while (not str.empty() and is_blank(str.back()))
		str.remove_suffix(1);

	return str;
}

// ASCII only, multi-byte UTF-8 sequences are left untouched
inline std::string to_upper(std::string_view str) {
	std::string res(str);
	std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
		return (c >= 'a' and c <= 'z' ? c - 'a' + 'A' : c);
	});
	return res;
}

inline std::string to_lower(std::string_view str) {
	std::string res(str);
	std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) {
		return (c >= 'A' and c <= 'Z' ? c - 'A' + 'a' : c);
	});
	return res;
}

inline bool equal_ignore_case(std::string_view a, std::string_view b) {
	return (a.size() == b.size() and to_upper(a) == to_upper(b));
}

// Replaces every occurrence of @p from in @p str with @p to
inline void replace_all(std::string& str, std::string_view from,
                        std::string_view to) {
	if (from.empty())
		return;

	size_t pos = 0;
	while ((pos = str.find(from, pos)) != std::string::npos) {
		str.replace(pos, from.size(), to);
		pos += to.size();
	}
}

// Converts a non-negative decimal integer, returns -1 if @p str is not one
inline long long parse_non_negative(std::string_view str) noexcept {
	if (str.empty() or str.size() > 18)
		return -1;

	long long res = 0;
	for (char c : str) {
		if (c < '0' or c > '9')
			return -1;
		res = res * 10 + (c - '0');
	}

	return res;
}
