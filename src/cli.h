#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "units.h"

// Runs one command-line invocation. args[0] is the program name.
// Results go to out, diagnostics to err. Returns the process exit code (0 or 1).
int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err,
           const UnitRegistry& registry = UnitRegistry::builtin());
