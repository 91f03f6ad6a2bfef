#include "../src/errors.h"
#include "../src/symbol_tables.h"
#include "../src/translate.h"

#include <gtest/gtest.h>

using std::string;

namespace {

// "(@NEG (@NEG ... x ...))" nested @p depth times
string nested_negations(int depth) {
	string res;
	for (int i = 0; i < depth; ++i)
		res += "(@NEG ";
	res += 'x';
	res.append(depth, ')');
	return res;
}

TranslatorConfig strict_config() {
	TranslatorConfig config;
	config.strict_nesting = true;
	return config;
}

} // namespace

/* Leaves */

TEST(TranslateTest, Empty) {
	EXPECT_EQ(translate(""), "");
	EXPECT_EQ(translate("   "), "");
}

TEST(TranslateTest, EveryGreekLetter) {
	for (auto const& letter : GREEK_LETTERS)
		EXPECT_EQ(translate(string(letter.source)), letter.tex) << letter.source;
}

TEST(TranslateTest, Symbols) {
	EXPECT_EQ(translate("α"), "\\alpha");
	EXPECT_EQ(translate("∞"), "\\infty");
	EXPECT_EQ(translate("e"), "e");
	EXPECT_EQ(translate("x"), "x");
	EXPECT_EQ(translate("(α + β)"), "(\\alpha + \\beta)");
}

/* Arithmetic */

TEST(TranslateTest, Arithmetic) {
	EXPECT_EQ(translate("(+ x y)"), "x + y");
	EXPECT_EQ(translate("(+ a b c)"), "a + b + c");
	EXPECT_EQ(translate("(- x y)"), "x - y");
	EXPECT_EQ(translate("(* 2 x)"), "2 \\cdot x");
	EXPECT_EQ(translate("(/ x y)"), "\\frac{x}{y}");
	EXPECT_EQ(translate("(+ (* 2 x) (/ y z))"), "2 \\cdot x + \\frac{y}{z}");
}

TEST(TranslateTest, Powers) {
	EXPECT_EQ(translate("(^ x 2)"), "{x}^{2}");
	EXPECT_EQ(translate("(^ e x)"), "e^{x}");
	EXPECT_EQ(translate("(^ (+ a b) 2)"), "{a + b}^{2}");
}

TEST(TranslateTest, IncompleteOperatorForms) {
	EXPECT_EQ(translate("(/ x)"), "");
	EXPECT_EQ(translate("(^ x)"), "");
	EXPECT_EQ(translate("(- x)"), "");
}

TEST(TranslateTest, Comparisons) {
	EXPECT_EQ(translate("(< a b)"), "a < b");
	EXPECT_EQ(translate("(> a b)"), "a > b");
	EXPECT_EQ(translate("(@LEQ x y)"), "x \\leq y");
	EXPECT_EQ(translate("(@GEQ x y)"), "x \\geq y");
	EXPECT_EQ(translate("(@NEQ x y)"), "x \\neq y");
}

TEST(TranslateTest, Negation) {
	EXPECT_EQ(translate("(@NEG x)"), "-x");
	EXPECT_EQ(translate("(@NEG (+ a b))"), "-\\left(a + b\\right)");
}

/* Calculus */

TEST(TranslateTest, Integral) {
	EXPECT_EQ(translate("(@INTEGRAL 0 1 x^2 x)"), "\\int_{0}^{1} x^2 \\, dx");
	EXPECT_EQ(translate("(@INTEGRAL 0 1 (@INTEGRAL 0 y x^2 x) y)"),
	          "\\int_{0}^{1} \\int_{0}^{y} x^2 \\, dx \\, dy");
	EXPECT_EQ(translate("(@INTEGRAL 0 π (@APPLY sin (@ARGS θ)) θ)"),
	          "\\int_{0}^{\\pi} \\sin(\\theta) \\, d\\theta");
	EXPECT_EQ(translate("(@INTEGRAL 0 1)"), "\\int{}");
}

TEST(TranslateTest, Derivative) {
	EXPECT_EQ(translate("(@DERIV x 1 (^ x 2))"), "\\frac{d}{dx} {x}^{2}");
	EXPECT_EQ(translate("(@DERIV x @PLACEHOLDER f)"), "\\frac{d}{dx} f");
	EXPECT_EQ(translate("(@DERIV x 2 (@PARENS (*x y)))"),
	          "\\frac{d^{2}}{dx^{2}} \\left(x \\cdot y\\right)");
	EXPECT_EQ(translate("(@DERIV x)"), "");
}

TEST(TranslateTest, PartialDerivative) {
	EXPECT_EQ(translate("(@PART_DERIV x 1 (@PARENS (+ x y)))"),
	          "\\frac{\\partial}{\\partial x} \\left(x + y\\right)");
	EXPECT_EQ(translate("(@PART_DERIV x 2 f)"),
	          "\\frac{\\partial^{2}}{\\partial x^{2}} f");
	EXPECT_EQ(translate("(@PART_DERIV x @PLACEHOLDER f 3)"),
	          "\\frac{\\partial^{3}}{\\partial x^{3}} f");
}

TEST(TranslateTest, Limit) {
	EXPECT_EQ(translate("(@LIMIT x 0 (@PARENS (/ (^ x 2) x)))"),
	          "\\lim_{x \\to 0} \\left(\\frac{{x}^{2}}{x}\\right)");
	EXPECT_EQ(translate("(@LIMIT x 0 @RIGHT_HAND (/ 1 x))"),
	          "\\lim_{x \\to 0^{+}} \\frac{1}{x}");
	EXPECT_EQ(translate("(@LIMIT x 0 @LEFT_HAND f)"),
	          "\\lim_{x \\to 0^{-}} f");
	EXPECT_EQ(translate("(@LIMIT x ∞ (/ 1 x))"),
	          "\\lim_{x \\to \\infty} \\frac{1}{x}");
}

TEST(TranslateTest, Prime) {
	EXPECT_EQ(translate("(@PRIME f)"), "f'");
	EXPECT_EQ(translate("(@PRIME f 2)"), "f''");
	EXPECT_EQ(translate("(@PRIME f 99)"), "f" + string(16, '\''))
	   << "the count is clamped";
}

TEST(TranslateTest, Roots) {
	EXPECT_EQ(translate("(@NTHROOT 2 x)"), "\\sqrt{x}");
	EXPECT_EQ(translate("(@NTHROOT 3 x)"), "\\sqrt[3]{x}");
	EXPECT_EQ(translate("(@NTHROOT @PLACEHOLDER x)"), "\\sqrt{x}");
}

TEST(TranslateTest, Sum) {
	EXPECT_EQ(translate("(@SUM (@IS i 1) 10 i^2)"), "\\sum_{i=1}^{10} i^2");
	EXPECT_EQ(translate("(@SUM k n k)"), "\\sum_{k=1}^{n} k");
	EXPECT_EQ(translate("(@SUM i n body extra)"), "\\sum_{i=1}^{n} body")
	   << "without @IS the start is always 1";
	EXPECT_EQ(translate("(@SUM k)"), "\\sum");
}

TEST(TranslateTest, Product) {
	EXPECT_EQ(translate("(@PRODUCT (@IS i 1) n i)"), "\\prod_{i=1}^{n} i");
	EXPECT_EQ(translate("(@PRODUCT j 2 m j)"), "\\prod_{j=2}^{m} j");
	EXPECT_EQ(translate("(@PRODUCT i 1 n)"), "\\prod_{i=1}^{n} 1")
	   << "a missing body is 1";
	EXPECT_EQ(translate("(@PRODUCT j)"), "");
}

/* Functions */

TEST(TranslateTest, Apply) {
	EXPECT_EQ(translate("(@APPLY sin (@ARGS x))"), "\\sin(x)");
	EXPECT_EQ(translate("(@APPLY ln (@ARGS x))"), "\\ln(x)");
	EXPECT_EQ(translate("(@APPLY abs (@ARGS x))"), "\\left|x\\right|");
	EXPECT_EQ(translate("(@APPLY abs)"), "\\left|\\right|");
	EXPECT_EQ(translate("(@APPLY f (@ARGS x y))"), "f(x, y)");
	EXPECT_EQ(translate("(@APPLY f)"), "f");
}

/* Relations and logic */

TEST(TranslateTest, Relations) {
	EXPECT_EQ(translate("(@IS (^ x 2) (+ y z))"), "{x}^{2} = y + z");
	EXPECT_EQ(translate("(@ELEMENT_OF x S)"), "x \\in S");
	EXPECT_EQ(translate("(= x (+ y z))"), "x = y + z");
}

TEST(TranslateTest, Logic) {
	EXPECT_EQ(translate("(@AND a b c)"), "a \\land b \\land c");
	EXPECT_EQ(translate("(@OR a b)"), "a \\lor b");
	EXPECT_EQ(translate("(@XOR a b)"), "a \\oplus b");
	EXPECT_EQ(translate("(@NOT p)"), "\\neg p");
}

TEST(TranslateTest, VectorProducts) {
	EXPECT_EQ(translate("(@CROSS a b)"), "a \\times b");
	EXPECT_EQ(translate("(@DOT a b)"), "a \\cdot b");
}

TEST(TranslateTest, Equation) {
	EXPECT_EQ(translate("(@EQ F (* m a))"), "F = m \\cdot a");
	EXPECT_EQ(translate("(@EQ y (/ 1 x))"), "y = \\frac{1}{x}");
	EXPECT_EQ(translate("(@EQ y x)"), "y = x");
}

/* Units, constants and labels */

TEST(TranslateTest, Scale) {
	EXPECT_EQ(translate("(@SCALE 5 kg)"), "5\\,\\mathrm{kg}");
	EXPECT_EQ(translate("(@SCALE 9.81 (/ m (^ s 2)))"),
	          "9.81\\,\\frac{\\mathrm{m}}{\\mathrm{s}^{2}}");
}

TEST(TranslateTest, RightScale) {
	EXPECT_EQ(translate("(@RSCALE (@PARENS (* 2 x)) (@LABEL UNIT N))"),
	          "2 \\cdot x\\,\\mathrm{N}");
}

TEST(TranslateTest, Labels) {
	EXPECT_EQ(translate("(@LABEL VARIABLE x)"), "x");
	EXPECT_EQ(translate("(@LABEL FUNCTION f)"), "\\operatorname{f}");
	EXPECT_EQ(translate("(@LABEL UNIT kg)"), "\\mathrm{kg}");
	EXPECT_EQ(translate("(@LABEL UNIT furlong)"), "\\mathrm{furlong}");
	EXPECT_EQ(translate("(@LABEL CONSTANT ℏ)"), "\\hbar");
	EXPECT_EQ(translate("(@LABEL CONSTANT μ_0)"), "\\mu_0");
}

TEST(TranslateTest, ConstantWithSubscript) {
	EXPECT_EQ(translate("(@LABEL CONSTANT (@ID ε (@SUB 0)))"),
	          "\\varepsilon_0");
}

TEST(TranslateTest, Identifier) {
	EXPECT_EQ(translate("(@ID x (@SUB 1))"), "x_{1}");
	EXPECT_EQ(translate("(@ID v (@SUB max))"), "v_{max}");
}

TEST(TranslateTest, Parentheses) {
	EXPECT_EQ(translate("(@PARENS (+ x y))"), "\\left(x + y\\right)");
	EXPECT_EQ(translate("(@PARENS)"), "()");
}

/* Matrices */

TEST(TranslateTest, Matrix) {
	EXPECT_EQ(translate("(@MATRIX 2 2 a b c d)"),
	          "\\begin{pmatrix}\na & b \\\\\nc & d\n\\end{pmatrix}");
}

TEST(TranslateTest, MatrixPaddedWithZeros) {
	EXPECT_EQ(translate("(@MATRIX 2 2 a b c)"),
	          "\\begin{pmatrix}\na & b \\\\\nc & 0\n\\end{pmatrix}");
}

TEST(TranslateTest, InvalidMatrix) {
	EXPECT_EQ(translate("(@MATRIX 2 2)"), "\\begin{pmatrix} \\end{pmatrix}");
	EXPECT_EQ(translate("(@MATRIX n 2 a b)"), "\\begin{pmatrix} \\end{pmatrix}");
	EXPECT_EQ(translate("(@MATRIX 100000 100000 a)"),
	          "\\begin{pmatrix} \\end{pmatrix}");
}

/* Evaluations */

TEST(TranslateTest, SymbolicEvaluation) {
	EXPECT_EQ(translate("(@SYM_EVAL (+ x x) (@KW_STACK) (* 2 x))"),
	          "x + x \\rightarrow 2 \\cdot x");
	EXPECT_EQ(translate("(@SYM_EVAL (+ x x) (* 2 x))"),
	          "x + x \\rightarrow 2 \\cdot x");
	EXPECT_EQ(translate("(@SYM_EVAL (+ x x) (@KW_STACK))"), "x + x");
}

TEST(TranslateTest, ComplexEvaluation) {
	EXPECT_EQ(translate("(/ (@LABEL CONSTANT h) (* 2 (@LABEL CONSTANT π)))"),
	          "\\frac{h}{2 \\cdot \\pi}");
	EXPECT_EQ(translate("(+ (@APPLY sin (@ARGS x)) 1)"), "\\sin(x) + 1");
}

TEST(TranslateTest, EvaluationWithSingleOperand) {
	EXPECT_EQ(translate("(- (@LABEL VARIABLE x))"), "-x");
	EXPECT_EQ(translate("(- (@APPLY f (@ARGS a b)))"), "-\\left(f(a, b)\\right)");
}

TEST(TranslateTest, EvaluationRewrittenByPatterns) {
	EXPECT_EQ(translate("(/ (@LABEL CONSTANT h))"), "h");
	EXPECT_EQ(translate("(/ (@APPLY sin (@ARGS x)))"), "\\sin(x)")
	   << "parentheses of a rewritten call are kept";
	EXPECT_EQ(translate("(/ (* 2 (@LABEL UNIT kg)))"), "2 \\cdot \\mathrm{kg}");
}

TEST(TranslateTest, UnbalancedEvaluationDispatchesEmbeddedTags) {
	EXPECT_EQ(translate("(/ (@LABEL CONSTANT h)))"), "(/ h))");
}

/* Robustness */

TEST(TranslateTest, UnknownTagPassesThrough) {
	EXPECT_EQ(translate("(@FOO x)"), "(@FOO x)");
}

TEST(TranslateTest, UnbalancedInputIsBestEffort) {
	EXPECT_EQ(translate("(+ x y"), "x + y");
	EXPECT_NO_THROW(translate("(+ x y))"));
	EXPECT_NO_THROW(translate(")))((("));
}

TEST(TranslateTest, StrictNestingThrows) {
	try {
		translate("(+ x y", strict_config());
		FAIL() << "expected MalformedInput";
	} catch (const MalformedInput& e) {
		EXPECT_EQ(e.partial_result(), "x + y");
		EXPECT_EQ(e.position(), 0u);
	}

	EXPECT_THROW(translate("(+ x y))", strict_config()), MalformedInput);
	EXPECT_EQ(translate("(+ x y)", strict_config()), "x + y");
}

TEST(TranslateTest, RecursionLimit) {
	TranslatorConfig config;
	config.max_depth = 10;
	EXPECT_EQ(translate(nested_negations(3), config),
	          "-\\left(-\\left(-x\\right)\\right)");

	try {
		translate(nested_negations(20), config);
		FAIL() << "expected RecursionLimitExceeded";
	} catch (const RecursionLimitExceeded& e) {
		EXPECT_EQ(e.limit(), 10);
	}
}

TEST(TranslateTest, InputLengthLimit) {
	TranslatorConfig config;
	config.max_input_length = 20;
	EXPECT_EQ(translate("(+ x y)", config), "x + y");

	try {
		translate("(+ " + string(30, 'x') + " y)", config);
		FAIL() << "expected InputTooLong";
	} catch (const InputTooLong& e) {
		EXPECT_EQ(e.length(), 35u);
		EXPECT_EQ(e.limit(), 20u);
	}
}

TEST(TranslateTest, LongWordRejectedInsteadOfCrashing) {
	string long_word = "(+ " + string(60000, 'x') + " y)";
	EXPECT_THROW(translate(long_word), InputTooLong);
	EXPECT_THROW(convert(long_word), InputTooLong);
}

TEST(TranslateTest, DefaultRecursionLimit) {
	EXPECT_THROW(translate(nested_negations(1000)), RecursionLimitExceeded);
}

/* Translation followed by refinement */

TEST(ConvertTest, RefinesTranslation) {
	EXPECT_EQ(convert("(@INTEGRAL 0 1 x^2 x)"),
	          "\\displaystyle\\int_{0}^{1} x^{2} \\, dx");
}

TEST(ConvertTest, AnnotatesUnrefined) {
	EXPECT_EQ(convert("(/ x y)"),
	          "\\frac{x}{y}  % No further refinements available");

	TranslatorConfig config;
	config.annotate_unrefined = false;
	EXPECT_EQ(convert("(/ x y)", config), "\\frac{x}{y}");
}
