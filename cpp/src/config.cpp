// docflow/cpp/src/config.cpp
#include "docflow/config.h"
#include "docflow/errors.h"
#include "docflow/log.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

using json = nlohmann::json;

namespace docflow {

namespace {

[[noreturn]] void bad_setting(const std::string& key, const std::string& why) {
    throw DocflowException(ErrorCode::ConfigError, "invalid setting \"" + key + "\": " + why);
}

// strtoll over the whole string; false on garbage
bool parse_int(const char* s, long long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (!end || *end != '\0') return false;
    out = v;
    return true;
}

} // namespace

void load_importer_settings(const json& j, ImporterConfig& cfg) {
    if (!j.is_object()) {
        throw DocflowException(ErrorCode::ConfigError, "importer settings must be a JSON object");
    }

    if (j.contains("temp_dir")) {
        const auto& v = j["temp_dir"];
        if (!v.is_string()) bad_setting("temp_dir", "expected string");
        cfg.streams.temp_dir = v.get<std::string>();
    }
    if (j.contains("memory_threshold")) {
        const auto& v = j["memory_threshold"];
        if (!v.is_number_unsigned()) bad_setting("memory_threshold", "expected non-negative integer");
        cfg.streams.memory_threshold = v.get<uint64_t>();
    }
    if (j.contains("case_sensitive_fields")) {
        const auto& v = j["case_sensitive_fields"];
        if (!v.is_boolean()) bad_setting("case_sensitive_fields", "expected boolean");
        cfg.case_sensitive_fields = v.get<bool>();
    }
    if (j.contains("max_embedded_depth")) {
        const auto& v = j["max_embedded_depth"];
        if (!v.is_number_integer()) bad_setting("max_embedded_depth", "expected integer");
        const long long d = v.get<long long>();
        if (d < -1) bad_setting("max_embedded_depth", "must be >= -1");
        if (d > std::numeric_limits<int>::max()) bad_setting("max_embedded_depth", "too large");
        cfg.max_embedded_depth = (int)d;
    }
    if (j.contains("parse_errors_save_dir")) {
        const auto& v = j["parse_errors_save_dir"];
        if (!v.is_string()) bad_setting("parse_errors_save_dir", "expected string");
        cfg.parse_errors_save_dir = v.get<std::string>();
    }
}

void load_importer_settings_file(const std::filesystem::path& p, ImporterConfig& cfg) {
    std::ifstream in(p);
    if (!in) throw DocflowException(ErrorCode::ConfigError, "cannot open settings: " + p.string());

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw DocflowException(ErrorCode::ConfigError,
                               "invalid JSON in " + p.string() + ": " + e.what());
    }
    load_importer_settings(j, cfg);
}

void apply_env_overrides(ImporterConfig& cfg) {
    if (const char* s = std::getenv("DOCFLOW_TEMP_DIR"); s && *s) {
        cfg.streams.temp_dir = s;
    }

    long long v = 0;
    if (const char* s = std::getenv("DOCFLOW_MAX_MEMORY_BYTES"); s && *s) {
        if (parse_int(s, v) && v >= 0) cfg.streams.memory_threshold = (uint64_t)v;
        else log_warn(std::string("ignoring DOCFLOW_MAX_MEMORY_BYTES=") + s);
    }
    if (const char* s = std::getenv("DOCFLOW_MAX_EMBEDDED_DEPTH"); s && *s) {
        if (parse_int(s, v) && v >= -1 && v <= std::numeric_limits<int>::max()) {
            cfg.max_embedded_depth = (int)v;
        } else {
            log_warn(std::string("ignoring DOCFLOW_MAX_EMBEDDED_DEPTH=") + s);
        }
    }
}

json settings_to_json(const ImporterConfig& cfg) {
    json j;
    j["temp_dir"] = cfg.streams.temp_dir.string();
    j["memory_threshold"] = cfg.streams.memory_threshold;
    j["case_sensitive_fields"] = cfg.case_sensitive_fields;
    j["max_embedded_depth"] = cfg.max_embedded_depth;
    j["parse_errors_save_dir"] = cfg.parse_errors_save_dir.string();
    return j;
}

} // namespace docflow
