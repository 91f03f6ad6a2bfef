#pragma once

// Each command gets the arguments following its name and returns the exit code

int translate_command(int argc, char** argv);

int refine_command(int argc, char** argv);

int convert_command(int argc, char** argv);

int examples_command(int argc, char** argv);
