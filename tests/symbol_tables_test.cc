#include "../src/symbol_tables.h"

#include <gtest/gtest.h>

TEST(SymbolTablesTest, GreekLetters) {
	EXPECT_EQ(lookup_symbol("α"), "\\alpha");
	EXPECT_EQ(lookup_symbol("ϑ"), "\\vartheta");
	EXPECT_EQ(lookup_symbol("Ω"), "\\Omega");
	EXPECT_EQ(lookup_symbol("Σ"), "\\Sigma");
}

TEST(SymbolTablesTest, SpecialSymbols) {
	EXPECT_EQ(lookup_symbol("°"), "^{\\circ}");
	EXPECT_EQ(lookup_symbol("″"), "^{\\prime\\prime}");
	EXPECT_EQ(lookup_symbol("†"), "{\\dagger}");
}

TEST(SymbolTablesTest, UnknownSymbol) {
	EXPECT_FALSE(lookup_symbol("x"));
	EXPECT_FALSE(lookup_symbol(""));
	EXPECT_FALSE(lookup_symbol("αβ")) << "only whole tokens are symbols";
}

TEST(SymbolTablesTest, UnitsExactMatch) {
	EXPECT_EQ(lookup_unit("kg"), "\\mathrm{kg}");
	EXPECT_EQ(lookup_unit("N"), "\\mathrm{N}");
	EXPECT_EQ(lookup_unit("newton"), "\\mathrm{N}");
	EXPECT_EQ(lookup_unit("deg"), "^{\\circ}");
}

TEST(SymbolTablesTest, UnitsIgnoreCase) {
	EXPECT_EQ(lookup_unit("KG"), "\\mathrm{kg}");
	EXPECT_EQ(lookup_unit("HZ"), "\\mathrm{Hz}");
	EXPECT_EQ(lookup_unit("Newton"), "\\mathrm{N}");
	EXPECT_FALSE(lookup_unit("furlong"));
}

TEST(SymbolTablesTest, UnitAfterSubstitution) {
	EXPECT_EQ(lookup_unit("Ω"), "\\Omega");
	EXPECT_EQ(lookup_unit("\\Omega"), "\\Omega");
}

TEST(SymbolTablesTest, Constants) {
	EXPECT_EQ(lookup_constant("ℏ"), "\\hbar");
	EXPECT_EQ(lookup_constant("k"), "k_\\mathrm{B}");
	EXPECT_EQ(lookup_constant("N_A"), "N_\\mathrm{A}");
	EXPECT_EQ(lookup_constant("ε_0"), "\\varepsilon_0");
	EXPECT_FALSE(lookup_constant("K")) << "constants are case sensitive";
}

TEST(SymbolTablesTest, ConstantAfterSubstitution) {
	EXPECT_EQ(lookup_constant("\\mu_0"), "\\mu_0");
	EXPECT_EQ(lookup_constant("\\epsilon_0"), "\\varepsilon_0");
	EXPECT_EQ(lookup_constant("R_\\infty"), "R_{\\infty}");
	EXPECT_FALSE(lookup_constant("\\pi"));
}

TEST(SymbolTablesTest, Functions) {
	EXPECT_EQ(lookup_function("sin"), "\\sin");
	EXPECT_EQ(lookup_function("log10"), "\\log_{10}");
	EXPECT_EQ(lookup_function("abs"), "\\left|#\\right|");
	EXPECT_FALSE(lookup_function("f"));
}

TEST(SymbolTablesTest, ReplaceSymbols) {
	EXPECT_EQ(replace_symbols("α+β=∞"), "\\alpha+\\beta=\\infty");
	EXPECT_EQ(replace_symbols("90°"), "90^{\\circ}");
	EXPECT_EQ(replace_symbols("x + y"), "x + y");
	EXPECT_EQ(replace_symbols(""), "");
}
