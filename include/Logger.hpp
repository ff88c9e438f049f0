#pragma once

#include <functional>
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

// Each call writes one whole line under a single mutex, so lines from the
// ingest worker and the finalizing thread never interleave.
// Debug and Info go to stdout, Warn and Error to stderr.
// Debug lines are emitted only when GPR_DEBUG is set in the environment.
void log_debug(const std::string& line);
void log_info(const std::string& line);
void log_warn(const std::string& line);
void log_error(const std::string& line);

// Every emitted line is also passed to the sink (tests use it to count
// warnings). The sink runs outside the log mutex and may call log_*() itself.
// Pass nullptr to remove it.
void set_log_sink(std::function<void(LogLevel, const std::string&)> sink);

const char* log_level_name(LogLevel level);
