#include "symbol_tables.h"
#include "string.h"
#include "utilities.h"

using std::nullopt;
using std::optional;
using std::string;
using std::string_view;

template <class Table>
static optional<string_view> lookup(const Table& table, string_view token) {
	if (auto sym = find_by_source(table, token))
		return sym->tex;

	return nullopt;
}

// Source tokens may contain Greek letters that had been substituted before
// the lookup, e.g. "μ_0" arrives as "\mu_0"
template <class Table>
static optional<string_view> lookup_substituted(const Table& table,
                                                string_view token) {
	if (token.find('\\') == string_view::npos)
		return nullopt;

	for (auto const& sym : table) {
		if (replace_symbols(string(sym.source)) == token)
			return sym.tex;
	}

	return nullopt;
}

optional<string_view> lookup_symbol(string_view token) {
	if (auto tex = lookup(GREEK_LETTERS, token))
		return tex;

	return lookup(SPECIAL_SYMBOLS, token);
}

optional<string_view> lookup_unit(string_view name) {
	if (auto tex = lookup(UNITS, name))
		return tex;

	for (auto const& sym : UNITS) {
		if (equal_ignore_case(sym.source, name))
			return sym.tex;
	}

	return lookup_substituted(UNITS, name);
}

optional<string_view> lookup_constant(string_view name) {
	if (auto tex = lookup(CONSTANTS, name))
		return tex;

	return lookup_substituted(CONSTANTS, name);
}

optional<string_view> lookup_function(string_view name) {
	return lookup(FUNCTIONS, name);
}

string replace_symbols(string text) {
	for (auto const& sym : GREEK_LETTERS)
		replace_all(text, sym.source, sym.tex);
	for (auto const& sym : SPECIAL_SYMBOLS)
		replace_all(text, sym.source, sym.tex);

	replace_all(text, INFINITY_SYMBOL, INFINITY_TEX);
	return text;
}
