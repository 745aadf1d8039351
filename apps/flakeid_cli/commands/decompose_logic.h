#pragma once

#include "flakeid/flake/id_codec.h"

#include <ostream>
#include <string>

// execute_decompose parses `text` in `format` and prints its decomposition as JSON.
// Returns the process exit code.
int execute_decompose(const std::string& text, flakeid::flake::IdFormat format,
                      std::ostream& out, std::ostream& err);
