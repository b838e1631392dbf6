// docflow/cpp/src/log.cpp
#include "docflow/log.h"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

namespace docflow {

static std::mutex g_log_mu;

static void write_line(const char* level, const std::string& msg) {
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[docflow] " << level << " " << msg << "\n";
}

bool env_bool(const char* key, bool defv) {
    const char* s = std::getenv(key);
    if (!s || !*s) return defv;
    if (std::strcmp(s, "1") == 0) return true;
    if (std::strcmp(s, "0") == 0) return false;
    if (std::strcmp(s, "true") == 0 || std::strcmp(s, "TRUE") == 0) return true;
    if (std::strcmp(s, "false") == 0 || std::strcmp(s, "FALSE") == 0) return false;
    return defv;
}

bool debug_enabled() {
    static const bool enabled = env_bool("DOCFLOW_DEBUG", false);
    return enabled;
}

void log_warn(const std::string& msg) { write_line("WARN", msg); }
void log_error(const std::string& msg) { write_line("ERROR", msg); }

void log_debug(const std::string& msg) {
    if (!debug_enabled()) return;
    write_line("DEBUG", msg);
}

} // namespace docflow
