#include "commands.h"
#include "config.h"
#include "errors.h"
#include "examples.h"
#include "refine_tex.h"
#include "string.h"
#include "translate.h"

#include <iostream>
#include <map>
#include <optional>
#include <vector>

using std::cerr;
using std::cin;
using std::cout;
using std::map;
using std::optional;
using std::string;
using std::vector;

namespace {

struct CommandLine {
	TranslatorConfig config;
	vector<string> positional;
};

// Recognizes --max-depth=N, --max-input-length=N, --strict, --verbose and
// --no-annotate, returns nullopt after reporting an unknown option
optional<CommandLine> parse_command_line(int argc, char** argv) {
	map<string, string> entries;
	CommandLine res;
	for (int i = 0; i < argc; ++i) {
		string arg = argv[i];
		if (arg == "--strict") {
			entries["strict_nesting"] = "true";
		} else if (arg == "--verbose") {
			entries["verbose"] = "true";
		} else if (arg == "--no-annotate") {
			entries["annotate_unrefined"] = "false";
		} else if (has_prefix(arg, "--max-depth=")) {
			entries["max_depth"] = arg.substr(12);
		} else if (has_prefix(arg, "--max-input-length=")) {
			entries["max_input_length"] = arg.substr(19);
		} else if (has_prefix(arg, "--")) {
			cerr << "Unknown option: " << arg << '\n';
			return std::nullopt;
		} else {
			res.positional.emplace_back(std::move(arg));
		}
	}

	res.config = config_from_map(entries);
	return res;
}

string read_input(const vector<string>& positional) {
	string input;
	if (not positional.empty()) {
		for (const string& arg : positional) {
			if (not input.empty())
				input += ' ';
			input += arg;
		}

		return input;
	}

	for (char c; (c = cin.get()), cin;)
		input += c;

	while (not input.empty() and is_blank(input.back()))
		input.pop_back();

	return input;
}

template <class Func>
int run_on_input(int argc, char** argv, Func&& func) {
	auto cmd = parse_command_line(argc, argv);
	if (not cmd)
		return 1;

	string input = read_input(cmd->positional);
	try {
		cout << func(input, cmd->config) << '\n';
	} catch (const MalformedInput& e) {
		cerr << "\033[1;31mMalformed input:\033[m " << e.what() << '\n';
		if (not e.partial_result().empty())
			cout << e.partial_result() << '\n';
		return 1;
	}

	return 0;
}

} // namespace

int translate_command(int argc, char** argv) {
	return run_on_input(argc, argv, [](const string& input, auto& config) {
		return translate(input, config);
	});
}

int refine_command(int argc, char** argv) {
	return run_on_input(argc, argv, [](const string& input, auto& config) {
		return refine(input, config);
	});
}

int convert_command(int argc, char** argv) {
	return run_on_input(argc, argv, [](const string& input, auto& config) {
		return convert(input, config);
	});
}

int examples_command(int argc, char** argv) {
	auto cmd = parse_command_line(argc, argv);
	if (not cmd)
		return 1;

	if (not cmd->positional.empty()) {
		cerr << "examples command takes no arguments\n";
		return 1;
	}

	for (const char* example : EXAMPLES) {
		cout << "\033[1mMathcad:\033[m " << example << '\n';
		cout << "\033[32mLaTeX:\033[m   " << convert(example, cmd->config)
		     << "\n\n";
	}

	return 0;
}
