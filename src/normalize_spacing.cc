#include "normalize_spacing.h"
#include "utilities.h"

#include <regex>
#include <utility>
#include <vector>

using std::regex;
using std::regex_replace;
using std::string;

namespace {

constexpr const char* GREEK_COMMANDS[] = {
   "pi",   "alpha", "beta",  "gamma",   "delta", "epsilon", "zeta",    "eta",
   "theta", "iota", "kappa", "lambda",  "mu",    "nu",      "xi",      "omicron",
   "rho",  "sigma", "tau",   "upsilon", "phi",   "chi",     "psi",     "omega",
};

// Commands that are always followed by a brace, index or a space
constexpr const char* COMPLETE_COMMANDS[] = {
   "int", "sum", "prod", "lim", "frac", "sqrt", "in"};

const std::vector<std::pair<regex, string>>& greek_patterns() {
	static const auto patterns = [] {
		std::vector<std::pair<regex, string>> res;
		for (const char* name : GREEK_COMMANDS) {
			res.emplace_back(regex(string("\\\\") + name + "([a-zA-Z0-9])"),
			                 string("\\") + name + " $1");
		}
		return res;
	}();
	return patterns;
}

bool is_alpha(char c) noexcept {
	return ((c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z'));
}

bool is_digit(char c) noexcept { return (c >= '0' and c <= '9'); }

// Control words swallow every following letter, so only a digit can be glued
// to the end of one
string space_commands_from_digits(const string& latex) {
	string res;
	res.reserve(latex.size());
	size_t i = 0;
	while (i < latex.size()) {
		if (latex[i] != '\\') {
			res += latex[i++];
			continue;
		}

		size_t name_beg = ++i;
		while (i < latex.size() and is_alpha(latex[i]))
			++i;

		string name = latex.substr(name_beg, i - name_beg);
		res += '\\';
		res += name;
		if (name.empty()) {
			// Control symbol like "\," or "\\", its character is not a
			// command start
			if (i < latex.size())
				res += latex[i++];
			continue;
		}

		if (i < latex.size() and is_digit(latex[i]) and
		    not contains(COMPLETE_COMMANDS, name)) {
			res += ' ';
		}
	}

	return res;
}

} // namespace

string normalize_spacing(const string& latex) {
	if (latex.find('\\') == string::npos)
		return latex;

	string res = latex;
	for (auto const& [pattern, replacement] : greek_patterns())
		res = regex_replace(res, pattern, replacement);

	return space_commands_from_digits(res);
}
