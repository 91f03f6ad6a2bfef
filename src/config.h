#pragma once

#include <cstddef>
#include <map>
#include <string>

struct TranslatorConfig {
	static constexpr int DEFAULT_MAX_DEPTH = 256;
	static constexpr size_t DEFAULT_MAX_INPUT_LENGTH = 10000;
	// Longer input may overflow the stack inside std::regex
	static constexpr size_t MAX_SAFE_INPUT_LENGTH = 20000;

	// Nesting level at which translation gives up with RecursionLimitExceeded
	int max_depth = DEFAULT_MAX_DEPTH;
	// Longer input is rejected with InputTooLong
	size_t max_input_length = DEFAULT_MAX_INPUT_LENGTH;
	// Throw MalformedInput on unbalanced parentheses instead of only warning
	bool strict_nesting = false;
	// Trace dispatch and warnings to stderr
	bool verbose = false;
	// refine() appends a comment when none of its rules applied
	bool annotate_unrefined = true;
};

/// Builds a config from key-value pairs. Recognized keys: max_depth,
/// max_input_length (at most MAX_SAFE_INPUT_LENGTH), strict_nesting, verbose,
/// annotate_unrefined. Booleans accept true/false/1/0/yes/no/on/off. Throws
/// std::invalid_argument on an unknown key or a malformed value.
TranslatorConfig
config_from_map(const std::map<std::string, std::string>& entries);
