#pragma once

#include <string>
#include <vector>

namespace diagram_cli {

const int exit_ok = 0;
// Bad options, unknown sample, or a diagram that failed to load.
const int exit_usage = 1;
const int exit_write_failed = 2;

// Runs the diagram_text tool; args excludes the program name.
int run(const std::string& program, const std::vector<std::string>& args);

} // namespace diagram_cli
