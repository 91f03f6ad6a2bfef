#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Splits @p content at spaces that are not nested in parentheses. Empty
/// pieces are skipped. Unbalanced parentheses are tolerated.
std::vector<std::string> split_top_level(std::string_view content);

/// Returns the arguments of the form "(TAG arg1 arg2 ...)". The tag (an @NAME
/// or a single operator character) is consumed first. Besides at top-level
/// spaces, a new argument also starts where a top-level "(" follows a
/// non-empty argument, e.g. "x(@SUB 1)" gives "x" and "(@SUB 1)".
std::vector<std::string> extract_arguments(std::string_view form);

/// Arguments of an operator form "(OP a b ...)" split at top-level spaces only
std::vector<std::string> extract_operator_arguments(std::string_view form);

/// Position of the parenthesis closing the one at @p open, npos if there is
/// none or text[open] is not "(".
size_t find_matching_parenthesis(std::string_view text, size_t open) noexcept;

struct NestingError {
	enum class Kind {
		UNEXPECTED_CLOSE, // ")" with nothing open
		UNCLOSED,         // "(" never closed
	};

	Kind kind;
	size_t position; // of the offending parenthesis
};

/// Returns the first parenthesis that breaks the balance of @p text
std::optional<NestingError> check_nesting(std::string_view text);

std::string describe(const NestingError& error);
