#include "refine_tex.h"
#include "errors.h"
#include "regex_utils.h"
#include "string.h"
#include "utilities.h"

#include <cctype>
#include <iostream>
#include <regex>
#include <utility>
#include <vector>

using std::regex;
using std::regex_replace;
using std::smatch;
using std::string;
using std::string_view;

namespace {

constexpr bool debug = false;

struct RuleResult {
	string tex;
	bool changed;
};

RuleResult changed_if_differs(const string& before, string after) {
	bool changed = (after != before);
	return {std::move(after), changed};
}

// Text of @p str preceding the match
string_view before_match(const string& str, const smatch& m) {
	return string_view(str).substr(0, m.position(0));
}

// a/b -> \frac{a}{b}. Operands glued to a command or to a function call are
// left alone.
RuleResult divisions_to_fractions(const string& tex) {
	static const regex division(R"((\w+|\([^)]+\)) */ *(\w+|\([^)]+\)))");
	return changed_if_differs(
	   tex, regex_replace_with(tex, division, [&tex](const smatch& m) {
		   auto before = before_match(tex, m);
		   auto after = string_view(tex).substr(m.position(0) + m.length(0));
		   bool group_first = (m.str(1).front() == '(');
		   bool torn =
		      (has_suffix(before, "\\") or has_suffix(before, "\\left") or
		       (group_first and not before.empty() and
		        isalpha(static_cast<unsigned char>(before.back()))) or
		       has_prefix(after, "(") or
		       m.str(0).find("\\right") != string::npos);
		   if (torn)
			   return m.str(0);

		   return "\\frac{" + m.str(1) + "}{" + m.str(2) + "}";
	   }));
}

RuleResult space_operators(const string& tex) {
	static const auto patterns = [] {
		constexpr const char* operators[] = {
		   "[+]",
		   "[-]",
		   "[=]",
		   "\\\\times(?![a-zA-Z])",
		   "\\\\cdot(?![a-zA-Z])",
		   "[<]",
		   "[>]",
		   "\\\\leq(?![a-zA-Z])",
		   "\\\\geq(?![a-zA-Z])",
		   "\\\\neq(?![a-zA-Z])",
		};

		std::vector<std::pair<regex, regex>> res;
		for (const char* op : operators) {
			// Escaped characters like "\-" and "\=" are not operators
			res.emplace_back(regex(string("([^\\s\\\\])(") + op + ")"),
			                 regex(string("(^|[^\\\\])(") + op + ")(?=\\S)"));
		}
		return res;
	}();

	// Adjacent operators like "a++b" need more than one pass
	constexpr int MAX_PASSES = 8;
	string res = tex;
	for (int pass = 0; pass < MAX_PASSES; ++pass) {
		string prev = res;
		for (auto const& [missing_before, missing_after] : patterns) {
			res = regex_replace(res, missing_before, "$1 $2");
			res = regex_replace(res, missing_after, "$1$2 ");
		}

		if (res == prev)
			break;
	}

	return changed_if_differs(tex, std::move(res));
}

// x^2 -> x^{2}
RuleResult brace_exponents(const string& tex) {
	static const regex exponent(R"((\w+)\^(\w)(?!\w))");
	return changed_if_differs(tex, regex_replace(tex, exponent, "$1^{$2}"));
}

// (\frac{a}{b} + c) -> \left(\frac{a}{b} + c\right)
RuleResult size_parentheses(const string& tex) {
	static const regex group(
	   R"((\\left)?\(([^()]*\\frac\{[^{}]*\}\{[^{}]*\}[^()]*)\))");
	return changed_if_differs(
	   tex, regex_replace_with(tex, group, [](const smatch& m) {
		   if (m[1].matched)
			   return m.str(0);

		   return "\\left(" + m.str(2) + "\\right)";
	   }));
}

// sin -> \sin, unless it is a part of a word, a command or an upright text
RuleResult escape_function_names(const string& tex) {
	static const regex name(
	   "(^|[^\\\\a-zA-Z])(arcsin|arccos|arctan|sinh|cosh|tanh|sin|cos|tan|"
	   "cot|sec|csc|log|ln|exp|lim|max|min)(?![a-zA-Z])");
	return changed_if_differs(
	   tex, regex_replace_with(tex, name, [&tex](const smatch& m) {
		   auto upto = string_view(tex).substr(0, m.position(2));
		   if (has_suffix(upto, "\\mathrm{") or
		       has_suffix(upto, "\\operatorname{") or
		       has_suffix(upto, "\\text{"))
			   return m.str(0);

		   return m.str(1) + "\\" + m.str(2);
	   }));
}

RuleResult display_big_operators(const string& tex) {
	static const regex big_operator(
	   R"(\\(int|sum|prod)(_\{[^}]*\}\^\{[^}]*\}))");
	return changed_if_differs(
	   tex, regex_replace_with(tex, big_operator, [&tex](const smatch& m) {
		   if (has_suffix(before_match(tex, m), "\\displaystyle"))
			   return m.str(0);

		   return "\\displaystyle" + m.str(0);
	   }));
}

// 10 kg -> 10\,\mathrm{kg}
RuleResult upright_units(const string& tex) {
	static const regex quantity(R"((^|[^a-zA-Z0-9_.\\])([0-9]+) *([a-zA-Z]+))");
	return changed_if_differs(
	   tex, regex_replace_with(tex, quantity, [](const smatch& m) {
		   // Most likely variables, not units
		   if (is_one_of(m.str(3), "x", "y", "z", "i", "j", "k", "t", "n",
		                 "a", "b", "c"))
			   return m.str(0);

		   return m.str(1) + m.str(2) + "\\,\\mathrm{" + m.str(3) + "}";
	   }));
}

} // namespace

string refine(const string& latex, const TranslatorConfig& config) {
	if (latex.empty())
		return latex;
	if (latex.size() > config.max_input_length)
		throw InputTooLong(latex.size(), config.max_input_length);

	using Rule = RuleResult (*)(const string&);
	static constexpr std::pair<const char*, Rule> rules[] = {
	   {"fractions", divisions_to_fractions},
	   {"operator spacing", space_operators},
	   {"exponents", brace_exponents},
	   {"parentheses", size_parentheses},
	   {"function names", escape_function_names},
	   {"display style", display_big_operators},
	   {"units", upright_units},
	};

	string res = latex;
	bool refined = false;
	for (auto const& [rule_name, rule] : rules) {
		auto [tex, changed] = rule(res);
		if constexpr (debug) {
			if (changed)
				std::cerr << rule_name << ": " << tex << '\n';
		}

		if (changed and config.verbose)
			std::cerr << "refined " << rule_name << '\n';

		refined |= changed;
		res = std::move(tex);
	}

	if (not refined and config.annotate_unrefined and
	    not has_suffix(res, NO_REFINEMENTS_NOTE))
		res += NO_REFINEMENTS_NOTE;

	return res;
}
