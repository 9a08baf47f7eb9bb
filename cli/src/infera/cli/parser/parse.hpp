#pragma once

#include "infera/cli/parser/action.hpp"

// Throws ParseError.
Action parse_argv(int argc, char **argv);

void print_help(HelpScope scope);
