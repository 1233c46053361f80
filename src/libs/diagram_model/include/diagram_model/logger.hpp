#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace diagram_model {

// Shared "diagram_text" logger. Writes to stderr until set_log_file() is called.
std::shared_ptr<spdlog::logger> logger();

// Redirects the shared logger to a truncated file. Returns false and keeps
// the current sinks when the file cannot be opened.
bool set_log_file(const std::string& path);

void set_log_level(spdlog::level::level_enum level);

} // namespace diagram_model
