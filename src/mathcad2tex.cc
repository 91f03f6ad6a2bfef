#include "commands.h"

#include <cstring>
#include <iostream>

using std::cerr;

int main2(int argc, char** argv) {
	if (argc < 2) {
		cerr << "Usage: " << argv[0] << " <command> [options] [expression]\n"
		     <<
		   R"=(Available commands:
  translate [expression]
                       Translates the Mathcad expression (read from input if
                         not given) to LaTeX and prints it.
  refine [latex]       Refines already generated LaTeX (read from input if not
                         given) and prints it.
  convert [expression] Translates the Mathcad expression and refines the
                         result.
  examples             Converts every built-in example expression.

Options:
  --max-depth=N        Gives up on expressions nested deeper than N levels.
  --max-input-length=N Rejects input longer than N characters (default
                         10000, at most 20000).
  --strict             Fails on unbalanced parentheses instead of only
                         translating what can be.
  --verbose            Prints the translation trace to the error output.
  --no-annotate        Does not mark LaTeX that refine could not improve.
)=";
		return 1;
	}

	const char* command = argv[1];
	if (strcmp(command, "translate") == 0)
		return translate_command(argc - 2, argv + 2);
	if (strcmp(command, "refine") == 0)
		return refine_command(argc - 2, argv + 2);
	if (strcmp(command, "convert") == 0)
		return convert_command(argc - 2, argv + 2);
	if (strcmp(command, "examples") == 0)
		return examples_command(argc - 2, argv + 2);

	cerr << "Unknown command: " << command << '\n';
	return 1;
}

int main(int argc, char** argv) {
	try {
		return main2(argc, argv);
	} catch (const std::exception& e) {
		cerr << "Error: " << e.what() << '\n';
		return 1;
	}
}
