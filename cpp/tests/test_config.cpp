#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "docflow/config.h"
#include "docflow/errors.h"
#include "docflow/log.h"

using json = nlohmann::json;

static std::filesystem::path test_data_file(const char* name) {
#ifndef DOCFLOW_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name;
#else
    return std::filesystem::path(DOCFLOW_TEST_DATA_DIR) / name;
#endif
}

static bool throws_config_error(const json& j) {
    docflow::ImporterConfig cfg;
    try {
        docflow::load_importer_settings(j, cfg);
    } catch (const docflow::DocflowException& e) {
        return e.code() == docflow::ErrorCode::ConfigError;
    }
    return false;
}

int main() {
    docflow::ImporterConfig defaults;
    assert(defaults.streams.memory_threshold == 1024u * 1024u);
    assert(defaults.streams.temp_dir.empty());
    assert(defaults.case_sensitive_fields);
    assert(defaults.max_embedded_depth == -1);
    assert(defaults.parse_errors_save_dir.empty());
    assert(defaults.parser_factory != nullptr);
    assert(defaults.detector != nullptr);

    docflow::ImporterConfig cfg;
    docflow::load_importer_settings_file(test_data_file("settings.json"), cfg);
    assert(cfg.streams.temp_dir == "/tmp/docflow-settings-test");
    assert(cfg.streams.memory_threshold == 4096);
    assert(!cfg.case_sensitive_fields);
    assert(cfg.max_embedded_depth == 2);
    assert(cfg.parse_errors_save_dir == "/tmp/docflow-parse-errors");
    assert(!cfg.same_settings(defaults));

    docflow::ImporterConfig again;
    docflow::load_importer_settings(docflow::settings_to_json(cfg), again);
    assert(again.same_settings(cfg));

    assert(throws_config_error(json::array()));
    assert(throws_config_error(json{{"memory_threshold", "big"}}));
    assert(throws_config_error(json{{"memory_threshold", -5}}));
    assert(throws_config_error(json{{"max_embedded_depth", -2}}));
    assert(throws_config_error(json{{"max_embedded_depth", 3000000000LL}}));
    assert(throws_config_error(json{{"case_sensitive_fields", 1}}));
    assert(!throws_config_error(json::object()));

    bool threw = false;
    try {
        docflow::load_importer_settings_file(test_data_file("cp1251.txt"), cfg);
    } catch (const docflow::DocflowException& e) {
        threw = (e.code() == docflow::ErrorCode::ConfigError);
    }
    assert(threw);

    setenv("DOCFLOW_TEMP_DIR", "/tmp/docflow-env", 1);
    setenv("DOCFLOW_MAX_MEMORY_BYTES", "123", 1);
    setenv("DOCFLOW_MAX_EMBEDDED_DEPTH", "not-a-number", 1);
    docflow::ImporterConfig env_cfg;
    docflow::apply_env_overrides(env_cfg);
    assert(env_cfg.streams.temp_dir == "/tmp/docflow-env");
    assert(env_cfg.streams.memory_threshold == 123);
    assert(env_cfg.max_embedded_depth == -1);

    setenv("DOCFLOW_MAX_EMBEDDED_DEPTH", "0", 1);
    docflow::apply_env_overrides(env_cfg);
    assert(env_cfg.max_embedded_depth == 0);

    setenv("DOCFLOW_MAX_EMBEDDED_DEPTH", "3000000000", 1);
    docflow::apply_env_overrides(env_cfg);
    assert(env_cfg.max_embedded_depth == 0);
    unsetenv("DOCFLOW_MAX_EMBEDDED_DEPTH");

    setenv("DOCFLOW_FLAG", "TRUE", 1);
    assert(docflow::env_bool("DOCFLOW_FLAG", false));
    unsetenv("DOCFLOW_FLAG");
    assert(!docflow::env_bool("DOCFLOW_FLAG", false));

    std::cout << "OK\n";
    return 0;
}
