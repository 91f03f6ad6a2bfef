#include "config.h"
#include "string.h"
#include "utilities.h"

#include <stdexcept>

using std::invalid_argument;
using std::map;
using std::string;

static bool parse_bool(const string& key, const string& value) {
	string v = to_lower(trim(value));
	if (is_one_of(v, "true", "1", "yes", "on"))
		return true;
	if (is_one_of(v, "false", "0", "no", "off"))
		return false;

	throw invalid_argument("invalid boolean for " + key + ": " + value);
}

static int parse_depth(const string& key, const string& value) {
	long long depth = parse_non_negative(trim(value));
	if (depth < 1 or depth > 100000)
		throw invalid_argument("invalid value for " + key + ": " + value);

	return static_cast<int>(depth);
}

static size_t parse_input_length(const string& key, const string& value) {
	long long length = parse_non_negative(trim(value));
	if (length < 1 or
	    length > static_cast<long long>(TranslatorConfig::MAX_SAFE_INPUT_LENGTH))
		throw invalid_argument("invalid value for " + key + ": " + value);

	return static_cast<size_t>(length);
}

TranslatorConfig config_from_map(const map<string, string>& entries) {
	TranslatorConfig config;
	for (auto const& [key, value] : entries) {
		if (key == "max_depth")
			config.max_depth = parse_depth(key, value);
		else if (key == "max_input_length")
			config.max_input_length = parse_input_length(key, value);
		else if (key == "strict_nesting")
			config.strict_nesting = parse_bool(key, value);
		else if (key == "verbose")
			config.verbose = parse_bool(key, value);
		else if (key == "annotate_unrefined")
			config.annotate_unrefined = parse_bool(key, value);
		else
			throw invalid_argument("unknown configuration key: " + key);
	}

	return config;
}
