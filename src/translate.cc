#include "translate.h"
#include "arguments.h"
#include "errors.h"
#include "normalize_spacing.h"
#include "refine_tex.h"
#include "regex_utils.h"
#include "string.h"
#include "symbol_tables.h"
#include "utilities.h"

#include <cctype>
#include <iostream>
#include <regex>

using std::regex;
using std::smatch;
using std::string;
using std::string_view;
using std::vector;

namespace {

constexpr bool debug = false;

constexpr string_view PLACEHOLDER = "@PLACEHOLDER";
// Bigger matrices are not expanded, padding them could exhaust the memory
constexpr long long MAX_MATRIX_CELLS = 1 << 16;
constexpr long long MAX_PRIMES = 16;

class DepthGuard {
	int& depth_;

public:
	DepthGuard(int& depth, int limit) : depth_(depth) {
		if (depth_ >= limit)
			throw RecursionLimitExceeded(limit);
		++depth_;
	}

	DepthGuard(const DepthGuard&) = delete;
	DepthGuard& operator=(const DepthGuard&) = delete;

	~DepthGuard() { --depth_; }
};

class Translator {
	using Handler = string (Translator::*)(const string&);

	struct TagHandler {
		string_view tag;
		Handler handler;
	};

	const TranslatorConfig& config_;
	int depth_ = 0;

	template <class... Args>
	void verbose_log(Args&&... args) {
		if (config_.verbose)
			(std::cerr << ... << std::forward<Args>(args));
	}

public:
	explicit Translator(const TranslatorConfig& config) : config_(config) {}

	Translator(const Translator&) = delete;
	Translator& operator=(const Translator&) = delete;

	string parse(string_view expression) {
		DepthGuard guard(depth_, config_.max_depth);
		string expr(trim(expression));
		string res = dispatch(std::move(expr));
		if constexpr (debug)
			std::cerr << string(depth_ - 1, ' ') << expression << " -> " << res
			          << '\n';

		return res;
	}

private:
	static Handler handler_for(string_view tag);

	static Handler operator_handler(const string& expr) {
		if (expr.size() < 2 or expr[0] != '(')
			return nullptr;

		switch (expr[1]) {
		case '+': return &Translator::handle_addition;
		case '-': return &Translator::handle_subtraction;
		case '*': return &Translator::handle_multiplication;
		case '/': return &Translator::handle_division;
		case '^': return &Translator::handle_power;
		case '<': return &Translator::handle_less_than;
		case '>': return &Translator::handle_greater_than;
		default: return nullptr;
		}
	}

	// Results of a symbolic evaluation mix raw operators with labeled leaves
	static bool is_complex_evaluation(const string& expr) {
		return (has_one_of_prefixes(expr, "(/", "(*", "(+", "(-") and
		        (expr.find("(@LABEL") != string::npos or
		         expr.find("(@APPLY") != string::npos));
	}

	static string_view tag_name(string_view expr) noexcept {
		// expr begins with "(@"
		size_t end = 2;
		while (end < expr.size() and
		       (isalnum(static_cast<unsigned char>(expr[end])) or
		        expr[end] == '_'))
			++end;

		return expr.substr(2, end - 2);
	}

	string dispatch(string expr) {
		if (expr.empty())
			return "";

		if (is_complex_evaluation(expr))
			return handle_complex_evaluation(expr);

		if (auto handler = operator_handler(expr))
			return (this->*handler)(expr);

		if (expr == "e")
			return "e";
		if (expr == INFINITY_SYMBOL)
			return string(INFINITY_TEX);
		if (auto tex = lookup_symbol(expr))
			return string(*tex);

		expr = replace_symbols(std::move(expr));

		if (has_prefix(expr, "(@")) {
			auto tag = tag_name(expr);
			if (auto handler = handler_for(tag)) {
				verbose_log("@", tag, ": ", expr, '\n');
				return normalize_spacing((this->*handler)(expr));
			}

			verbose_log("unknown tag @", tag, ", passing through\n");
		} else if (has_prefix(expr, "(=")) {
			return normalize_spacing(handle_equals(expr));
		}

		return normalize_spacing(expr);
	}

	string parse_and_join(const vector<string>& args, string_view separator) {
		string res;
		for (size_t i = 0; i < args.size(); ++i) {
			if (i > 0)
				res += separator;
			res += parse(args[i]);
		}

		return res;
	}

	string binary(const string& expr, string_view op) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		return parse(args[0]) + ' ' + string(op) + ' ' + parse(args[1]);
	}

	string chain(const string& expr, string_view op) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		return parse_and_join(args, " " + string(op) + " ");
	}

	// "(@PARENS x)" is unwrapped and given \left( \right)
	string parse_parenthesized(const string& arg) {
		if (not has_prefix(arg, "(@PARENS"))
			return parse(arg);

		auto inner = extract_arguments(arg);
		if (inner.empty())
			return "";

		return "\\left(" + parse(inner[0]) + "\\right)";
	}

	/* Arithmetic */

	string handle_addition(const string& expr) {
		return parse_and_join(extract_arguments(expr), " + ");
	}

	string handle_subtraction(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		return parse(args[0]) + " - " + parse(args[1]);
	}

	string handle_multiplication(const string& expr) {
		return parse_and_join(extract_arguments(expr), " \\cdot ");
	}

	string handle_division(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		return "\\frac{" + parse(args[0]) + "}{" + parse(args[1]) + "}";
	}

	string handle_power(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		string base = parse(args[0]);
		string exponent = parse(args[1]);
		if (base == "e")
			return "e^{" + exponent + "}";

		return "{" + base + "}^{" + exponent + "}";
	}

	string handle_less_than(const string& expr) { return binary(expr, "<"); }

	string handle_greater_than(const string& expr) {
		return binary(expr, ">");
	}

	string handle_negation(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		return negated(parse(args[0]));
	}

	static string negated(const string& operand) {
		if (operand.find_first_of(" +-") != string::npos)
			return "-\\left(" + operand + "\\right)";

		return "-" + operand;
	}

	/* Calculus */

	string handle_integral(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 4)
			return "\\int{}";

		return "\\int_{" + parse(args[0]) + "}^{" + parse(args[1]) + "} " +
		       parse(args[2]) + " \\, d" + parse(args[3]);
	}

	string handle_derivative(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return "";

		string variable = parse(args[0]);
		string order = (args[1] == PLACEHOLDER ? "1" : parse(args[1]));
		string function = parse_parenthesized(args[2]);

		if (order == "1")
			return "\\frac{d}{d" + variable + "} " + function;

		return "\\frac{d^{" + order + "}}{d" + variable + "^{" + order +
		       "}} " + function;
	}

	string handle_partial_derivative(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return "";

		string variable = parse(args[0]);
		string order;
		if (parse_non_negative(args[1]) >= 0)
			order = args[1];
		else if (args[1] == PLACEHOLDER and args.size() > 3)
			order = parse(args[3]);

		string function = parse_parenthesized(args[2]);

		if (order.empty() or order == "1")
			return "\\frac{\\partial}{\\partial " + variable + "} " + function;

		return "\\frac{\\partial^{" + order + "}}{\\partial " + variable +
		       "^{" + order + "}} " + function;
	}

	string handle_limit(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return "";

		string variable = parse(args[0]);
		string approach = parse(args[1]);

		string direction;
		size_t function_idx = 2;
		if (args[2] == "@LEFT_HAND") {
			direction = "^{-}";
			function_idx = 3;
		} else if (args[2] == "@RIGHT_HAND") {
			direction = "^{+}";
			function_idx = 3;
		}

		string function = (function_idx < args.size()
		                      ? parse_parenthesized(args[function_idx])
		                      : variable);

		return "\\lim_{" + variable + " \\to " + approach + direction + "} " +
		       function;
	}

	string handle_prime(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		long long count = (args.size() > 1 ? parse_non_negative(args[1]) : 1);
		if (count < 0)
			count = 1;
		else if (count > MAX_PRIMES)
			count = MAX_PRIMES;

		return parse(args[0]) + string(count, '\'');
	}

	string handle_nthroot(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		string order = (args[0] == PLACEHOLDER ? "" : parse(args[0]));
		string radicand = parse(args[1]);
		if (order.empty() or order == "2")
			return "\\sqrt{" + radicand + "}";

		return "\\sqrt[" + order + "]{" + radicand + "}";
	}

	/* Big operators */

	struct BigOperatorBounds {
		string variable;
		string start;
		string upper;
		string body;
	};

	// The bounds of a big operator given as [(@IS var start) upper body]
	BigOperatorBounds parse_is_bounds(const vector<string>& args) {
		BigOperatorBounds res;
		auto is_args = extract_arguments(args[0]);
		if (is_args.size() >= 2) {
			res.variable = parse(is_args[0]);
			res.start = parse(is_args[1]);
		} else {
			res.variable = "i";
			res.start = "1";
		}

		res.upper = parse(args[1]);
		res.body = parse(args[2]);
		return res;
	}

	// [(@IS var start) upper body] or [var upper body], start defaults to 1
	string handle_sum(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return "\\sum";

		BigOperatorBounds b;
		if (has_prefix(args[0], "(@IS")) {
			b = parse_is_bounds(args);
		} else {
			b.variable = parse(args[0]);
			b.start = "1";
			b.upper = parse(args[1]);
			b.body = parse(args[2]);
		}

		return "\\sum_{" + b.variable + "=" + b.start + "}^{" + b.upper + "} " +
		       b.body;
	}

	// [(@IS var start) upper body] or [var start upper (body)], a missing body
	// is 1
	string handle_product(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return "";

		BigOperatorBounds b;
		if (has_prefix(args[0], "(@IS")) {
			b = parse_is_bounds(args);
		} else {
			b.variable = parse(args[0]);
			b.start = parse(args[1]);
			b.upper = parse(args[2]);
			b.body = (args.size() > 3 ? parse(args[3]) : "1");
		}

		return "\\prod_{" + b.variable + "=" + b.start + "}^{" + b.upper +
		       "} " + b.body;
	}

	/* Functions */

	string handle_apply(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		string name = to_lower(args[0]);
		string function;
		if (has_prefix(args[0], "("))
			function = parse(args[0]);
		else if (auto tex = lookup_function(name))
			function = *tex;
		else
			function = args[0];

		if (args.size() < 2 or not has_prefix(args[1], "(@ARGS")) {
			replace_all(function, "#", "");
			return function;
		}

		string arguments = handle_args(args[1]);
		if (name == "abs") {
			replace_all(function, "#", arguments);
			return function;
		}

		return function + "(" + arguments + ")";
	}

	string handle_args(const string& expr) {
		return parse_and_join(extract_arguments(expr), ", ");
	}

	/* Relations and logic */

	string handle_element_of(const string& expr) {
		return binary(expr, "\\in");
	}

	string handle_xor(const string& expr) { return binary(expr, "\\oplus"); }

	string handle_geq(const string& expr) { return binary(expr, "\\geq"); }

	string handle_leq(const string& expr) { return binary(expr, "\\leq"); }

	string handle_neq(const string& expr) { return binary(expr, "\\neq"); }

	string handle_and(const string& expr) { return chain(expr, "\\land"); }

	string handle_or(const string& expr) { return chain(expr, "\\lor"); }

	string handle_not(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		return "\\neg " + parse(args[0]);
	}

	string handle_is(const string& expr) { return binary(expr, "="); }

	string handle_cross(const string& expr) { return binary(expr, "\\times"); }

	string handle_dot(const string& expr) { return binary(expr, "\\cdot"); }

	/* Units */

	// Unit part of a quantity: a unit name, a unit fraction or a unit power
	string unit_tex(const string& unit) {
		DepthGuard guard(depth_, config_.max_depth);
		if (auto sym = find_by_source(UNITS, unit))
			return string(sym->tex);

		if (has_one_of_prefixes(unit, "(/", "(^")) {
			auto args = extract_arguments(unit);
			if (args.size() >= 2 and unit[1] == '/')
				return "\\frac{" + unit_tex(args[0]) + "}{" + unit_tex(args[1]) +
				       "}";
			if (args.size() >= 2)
				return unit_tex(args[0]) + "^{" + parse(args[1]) + "}";
		}

		return parse(unit);
	}

	string handle_scale(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		string value = parse(args[0]);
		if (has_one_of_prefixes(args[1], "(/", "(^") and
		    extract_arguments(args[1]).size() < 2)
			return value;

		return value + "\\," + unit_tex(args[1]);
	}

	static string label_unit_tex(string_view name) {
		if (auto tex = lookup_unit(name))
			return string(*tex);

		return "\\mathrm{" + string(name) + "}";
	}

	string handle_rscale(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		string value;
		if (has_prefix(args[0], "(@PARENS")) {
			auto inner = extract_arguments(args[0]);
			if (not inner.empty())
				value = parse(inner[0]);
		} else {
			value = parse(args[0]);
		}

		string unit;
		auto label_args = (has_prefix(args[1], "(@LABEL")
		                      ? extract_arguments(args[1])
		                      : vector<string> {});
		if (label_args.size() >= 2 and to_upper(label_args[0]) == "UNIT")
			unit = label_unit_tex(label_args[1]);
		else
			unit = parse(args[1]);

		return value + "\\," + unit;
	}

	/* Grouping and identifiers */

	string handle_parentheses(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "()";

		return "\\left(" + parse(args[0]) + "\\right)";
	}

	// Constants with a subscript come as "(@ID name (@SUB sub))", e.g. ε_0
	string constant_with_subscript(const string& id) {
		auto id_args = extract_arguments(id);
		if (id_args.size() < 2)
			return id;

		const string& name = id_args[0];
		string sub = id_args[1];
		if (has_prefix(sub, "(@SUB")) {
			auto sub_args = extract_arguments(sub);
			sub = (sub_args.empty() ? "" : sub_args[0]);
		}

		if (auto tex = lookup_constant(name + "_" + sub))
			return string(*tex);

		return name + "_{" + parse(sub) + "}";
	}

	string handle_label(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		string type = to_upper(args[0]);
		if (is_one_of(type, "CONSTANT", "UNIT", "VARIABLE", "FUNCTION") and
		    args.size() < 2)
			return "";

		if (type == "CONSTANT") {
			if (auto tex = lookup_constant(args[1]))
				return string(*tex);
			if (has_prefix(args[1], "(@ID"))
				return constant_with_subscript(args[1]);

			return args[1];
		}

		if (type == "UNIT")
			return label_unit_tex(args[1]);
		if (type == "VARIABLE")
			return args[1];
		if (type == "FUNCTION")
			return "\\operatorname{" + args[1] + "}";

		return (args.size() > 1 ? parse(args[1]) : args[0]);
	}

	string handle_subscript(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.empty())
			return "";

		return "{" + parse(args[0]) + "}";
	}

	string handle_identifier(const string& expr) {
		size_t sub_beg = expr.find("(@SUB");
		if (sub_beg == string::npos)
			return expr;

		auto args = extract_arguments(expr);
		if (args.empty() or has_prefix(args[0], "("))
			return expr;

		const string& identifier = args[0];
		size_t sub_end = find_matching_parenthesis(expr, sub_beg);
		if (sub_end == string::npos)
			return identifier;

		auto sub_args =
		   extract_arguments(string_view(expr).substr(sub_beg, sub_end - sub_beg + 1));
		if (sub_args.empty())
			return identifier;

		return identifier + "_{" + parse(sub_args[0]) + "}";
	}

	/* Matrices */

	string handle_matrix(const string& expr) {
		static constexpr const char* EMPTY_MATRIX =
		   "\\begin{pmatrix} \\end{pmatrix}";

		auto args = extract_arguments(expr);
		if (args.size() < 3)
			return EMPTY_MATRIX;

		long long rows = parse_non_negative(args[0]);
		long long cols = parse_non_negative(args[1]);
		if (rows < 0 or cols < 0 or rows * cols > MAX_MATRIX_CELLS) {
			verbose_log("invalid matrix dimensions: ", args[0], " x ", args[1],
			            '\n');
			return EMPTY_MATRIX;
		}

		string res = "\\begin{pmatrix}\n";
		size_t idx = 2;
		for (long long i = 0; i < rows; ++i) {
			if (i > 0)
				res += " \\\\\n";

			for (long long j = 0; j < cols; ++j, ++idx) {
				if (j > 0)
					res += " & ";
				res += (idx < args.size() ? parse(args[idx]) : "0");
			}
		}

		res += "\n\\end{pmatrix}";
		return res;
	}

	/* Equations and evaluations */

	string handle_sym_eval(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		string left = parse(args[0]);
		size_t right_idx = (has_prefix(args[1], "(@KW_STACK") ? 2 : 1);
		string right = (right_idx < args.size() ? parse(args[right_idx]) : "");
		if (right.empty())
			return left;

		return left + " \\rightarrow " + right;
	}

	// Arithmetic on the right-hand side is flattened in place
	string equation_rhs(const string& rhs) {
		if (not has_one_of_prefixes(rhs, "(+", "(-", "(*", "(/"))
			return parse(rhs);

		auto args = extract_operator_arguments(rhs);
		switch (rhs[1]) {
		case '+':
			if (not args.empty())
				return parse_and_join(args, " + ");
			break;
		case '-':
			if (args.size() == 2)
				return parse(args[0]) + " - " + parse(args[1]);
			break;
		case '*':
			if (not args.empty())
				return parse_and_join(args, " \\cdot ");
			break;
		case '/':
			if (args.size() == 2)
				return "\\frac{" + parse(args[0]) + "}{" + parse(args[1]) + "}";
			break;
		}

		return parse(rhs);
	}

	string handle_equation(const string& expr) {
		auto args = extract_arguments(expr);
		if (args.size() < 2)
			return "";

		return parse(args[0]) + " = " + equation_rhs(args[1]);
	}

	// "(= lhs rhs...)", everything after the first argument is the rhs
	string handle_equals(const string& expr) {
		auto args = extract_operator_arguments(expr);
		if (args.size() < 2)
			return expr;

		string rhs = args[1];
		for (size_t i = 2; i < args.size(); ++i)
			rhs.append(" ").append(args[i]);

		return parse(args[0]) + " = " + parse(rhs);
	}

	/* Symbolic evaluation results */

	string handle_complex_evaluation(const string& expr) {
		auto args = extract_operator_arguments(expr);
		switch (expr[1]) {
		case '/':
			if (args.size() >= 2)
				return "\\frac{" + parse(args[0]) + "}{" + parse(args[1]) + "}";
			break;
		case '*':
			if (not args.empty())
				return parse_and_join(args, " \\cdot ");
			break;
		case '+':
			if (not args.empty())
				return parse_and_join(args, " + ");
			break;
		case '-':
			if (args.size() >= 2)
				return parse(args[0]) + " - " + parse(args[1]);
			if (args.size() == 1)
				return negated(parse(args[0]));
			break;
		}

		verbose_log("cannot split ", expr, ", rewriting it\n");
		string rewritten = rewrite_evaluation(expr);
		if (rewritten != expr and not check_nesting(rewritten))
			return normalize_spacing(replace_symbols(std::move(rewritten)));

		verbose_log("rewriting ", expr, " left ", rewritten,
		            ", dispatching its tags\n");
		if (auto handler = operator_handler(expr)) {
			string res = (this->*handler)(expr);
			if (not res.empty())
				return res;
		}

		return dispatch_embedded_tags(expr);
	}

	// Rewritten pieces are parked behind "\x01<index>\x02" tokens, so that each
	// one is a single operand of the enclosing form
	class Stash {
		vector<string> pieces_;

		static string token(size_t idx) {
			return "\x01" + std::to_string(idx) + "\x02";
		}

	public:
		string park(string tex) {
			pieces_.emplace_back(std::move(tex));
			return token(pieces_.size() - 1);
		}

		// Pieces only refer to pieces parked before them
		string unpark(string text) const {
			for (size_t i = pieces_.size(); i-- > 0;)
				replace_all(text, token(i), pieces_[i]);

			return text;
		}
	};

	static string join_operands(const string& operands, string_view separator) {
		string res;
		for (const string& operand : split_top_level(operands)) {
			if (not res.empty())
				res += separator;
			res += operand;
		}

		return res;
	}

	// Pattern-based reconstruction of an expression that cannot be split
	// structurally. Only innermost forms match, so nested ones resolve from
	// the inside out.
	string rewrite_evaluation(const string& expr) {
		static const regex label_re(R"(\(@LABEL\s+([A-Za-z]+)\s+([^()\s]+)\))");
		static const regex apply_re(
		   R"(\(@APPLY\s+([^()\s]+)\s+\(@ARGS\s+([^()]*)\)\))");
		static const regex fraction_re(
		   R"(\(/\s+([^()\s]+)(?:\s+([^()\s]+))?\))");
		static const regex difference_re(
		   R"(\(-\s+([^()\s]+)(?:\s+([^()\s]+))?\))");
		static const regex power_re(R"(\(\^\s+([^()\s]+)\s+([^()\s]+)\))");
		static const regex product_re(R"(\(\*\s+([^()\s]+(?:\s+[^()\s]+)*)\))");
		static const regex sum_re(R"(\(\+\s+([^()\s]+(?:\s+[^()\s]+)*)\))");
		constexpr int MAX_ROUNDS = 64;

		Stash stash;
		string res = expr;
		for (int round = 0; round < MAX_ROUNDS; ++round) {
			string prev = res;
			res = regex_replace_with(res, label_re, [&](const smatch& m) {
				string type = to_upper(m.str(1));
				string value = m.str(2);
				if (type == "CONSTANT") {
					auto tex = lookup_constant(value);
					return stash.park(tex ? string(*tex) : value);
				}
				if (type == "UNIT")
					return stash.park(label_unit_tex(value));
				if (type == "FUNCTION")
					return stash.park("\\operatorname{" + value + "}");

				return stash.park(value);
			});

			res = regex_replace_with(res, apply_re, [&](const smatch& m) {
				string name = m.str(1);
				string args = join_operands(m.str(2), ", ");
				auto tex = lookup_function(to_lower(name));
				string function = (tex ? string(*tex) : name);
				if (function.find('#') != string::npos) {
					replace_all(function, "#", args);
					return stash.park(function);
				}

				return stash.park(function + "(" + args + ")");
			});

			res = regex_replace_with(res, fraction_re, [&](const smatch& m) {
				if (not m[2].matched)
					return m.str(1);

				return stash.park("\\frac{" + m.str(1) + "}{" + m.str(2) + "}");
			});

			res = regex_replace_with(res, difference_re, [&](const smatch& m) {
				if (not m[2].matched)
					return stash.park(negated(stash.unpark(m.str(1))));

				return stash.park(m.str(1) + " - " + m.str(2));
			});

			res = regex_replace_with(res, power_re, [&](const smatch& m) {
				return stash.park("{" + m.str(1) + "}^{" + m.str(2) + "}");
			});

			res = regex_replace_with(res, product_re, [&](const smatch& m) {
				return stash.park(join_operands(m.str(1), " \\cdot "));
			});

			res = regex_replace_with(res, sum_re, [&](const smatch& m) {
				return stash.park(join_operands(m.str(1), " + "));
			});

			if (res == prev)
				break;
		}

		return stash.unpark(strip_markers(std::move(res)));
	}

	// Drops the "(@TAG" and "(OP" markers that no rewrite consumed, each
	// together with its closing parenthesis
	static string strip_markers(string text) {
		static const regex marker_re(R"(\((@[A-Z_]+\s*|[-+*/^]\s+))");
		smatch m;
		while (std::regex_search(text, m, marker_re)) {
			size_t beg = m.position(0);
			size_t len = m.length(0);
			size_t end = find_matching_parenthesis(text, beg);
			if (end != string::npos)
				text.erase(end, 1);
			text.erase(beg, len);
		}

		return string(trim(text));
	}

	// Last resort: translate every innermost "(@TAG ...)" on its own
	string dispatch_embedded_tags(const string& expr) {
		static const regex tag_re(R"(\(@([A-Z_]+)([^()]*)\))");
		return regex_replace_with(expr, tag_re, [this](const smatch& m) {
			if (auto handler = handler_for(m.str(1)))
				return (this->*handler)(m.str(0));

			return m.str(0);
		});
	}
};

Translator::Handler Translator::handler_for(string_view tag) {
	static constexpr TagHandler handlers[] = {
	   {"AND", &Translator::handle_and},
	   {"APPLY", &Translator::handle_apply},
	   {"ARGS", &Translator::handle_args},
	   {"CROSS", &Translator::handle_cross},
	   {"DERIV", &Translator::handle_derivative},
	   {"DOT", &Translator::handle_dot},
	   {"ELEMENT_OF", &Translator::handle_element_of},
	   {"EQ", &Translator::handle_equation},
	   {"GEQ", &Translator::handle_geq},
	   {"ID", &Translator::handle_identifier},
	   {"INTEGRAL", &Translator::handle_integral},
	   {"IS", &Translator::handle_is},
	   {"LABEL", &Translator::handle_label},
	   {"LEQ", &Translator::handle_leq},
	   {"LIMIT", &Translator::handle_limit},
	   {"MATRIX", &Translator::handle_matrix},
	   {"NEG", &Translator::handle_negation},
	   {"NEQ", &Translator::handle_neq},
	   {"NOT", &Translator::handle_not},
	   {"NTHROOT", &Translator::handle_nthroot},
	   {"OR", &Translator::handle_or},
	   {"PARENS", &Translator::handle_parentheses},
	   {"PART_DERIV", &Translator::handle_partial_derivative},
	   {"PRIME", &Translator::handle_prime},
	   {"PRODUCT", &Translator::handle_product},
	   {"RSCALE", &Translator::handle_rscale},
	   {"SCALE", &Translator::handle_scale},
	   {"SUB", &Translator::handle_subscript},
	   {"SUM", &Translator::handle_sum},
	   {"SYM_EVAL", &Translator::handle_sym_eval},
	   {"XOR", &Translator::handle_xor},
	};

	for (auto const& [name, handler] : handlers) {
		if (name == tag)
			return handler;
	}

	return nullptr;
}

} // namespace

string translate(const string& input, const TranslatorConfig& config) {
	if (input.size() > config.max_input_length)
		throw InputTooLong(input.size(), config.max_input_length);

	auto nesting = check_nesting(input);
	if (nesting and config.verbose and not config.strict_nesting)
		std::cerr << "\033[33mWarning:\033[m " << describe(*nesting) << '\n';

	string res = Translator(config).parse(input);
	if (nesting and config.strict_nesting)
		throw MalformedInput(describe(*nesting), std::move(res),
		                     nesting->position);

	return res;
}

string convert(const string& input, const TranslatorConfig& config) {
	return refine(translate(input, config), config);
}
