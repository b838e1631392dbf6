// docflow/cpp/include/docflow/log.h
#pragma once
#include <string>

namespace docflow {

// One line per message on stderr, prefixed "[docflow]".
void log_warn(const std::string& msg);
void log_error(const std::string& msg);

// Printed only when DOCFLOW_DEBUG is 1/true.
void log_debug(const std::string& msg);
bool debug_enabled();

// env helpers shared by config and logging
bool env_bool(const char* key, bool defv);

} // namespace docflow
