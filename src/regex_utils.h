#pragma once

#include <regex>
#include <string>

// Like std::regex_replace(), but the replacement of each match is computed by
// @p func(const std::smatch&) -> std::string. Match positions are relative to
// @p str.
template <class Func>
std::string regex_replace_with(const std::string& str, const std::regex& re,
                               Func&& func) {
	std::string res;
	auto last = str.cbegin();
	for (std::sregex_iterator it(str.begin(), str.end(), re), end; it != end;
	     ++it) {
		const std::smatch& match = *it;
		res.append(last, match[0].first);
		res += func(match);
		last = match[0].second;
	}

	res.append(last, str.cend());
	return res;
}
