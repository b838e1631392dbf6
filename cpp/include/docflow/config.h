// docflow/cpp/include/docflow/config.h
#pragma once
#include <filesystem>
#include <memory>
#include <vector>

#include <nlohmann/json.hpp>

#include "docflow/content_stream.h"
#include "docflow/content_type.h"
#include "docflow/flow.h"
#include "docflow/parser.h"
#include "docflow/response.h"

namespace docflow {

struct ImporterConfig {
    StreamConfig streams;

    // metadata field-name matching of imported documents
    bool case_sensitive_fields{true};

    Steps pre_parse_steps;
    Steps post_parse_steps;

    // null => nothing is parsed
    std::shared_ptr<ParserFactory> parser_factory{std::make_shared<DefaultParserFactory>()};
    // null => documents without a content type get application/octet-stream
    std::shared_ptr<ContentTypeDetector> detector{std::make_shared<DefaultContentTypeDetector>()};

    // run once on every root response
    std::vector<std::shared_ptr<ResponseProcessor>> response_processors;

    // -1 => unlimited; 0 => children are dropped
    int max_embedded_depth{-1};

    // empty => parse errors are not saved
    std::filesystem::path parse_errors_save_dir;

    // scalar settings only; steps and collaborators are compared by identity elsewhere
    bool same_settings(const ImporterConfig& o) const {
        return streams == o.streams &&
               case_sensitive_fields == o.case_sensitive_fields &&
               max_embedded_depth == o.max_embedded_depth &&
               parse_errors_save_dir == o.parse_errors_save_dir;
    }
};

// Reads the scalar settings present in `j`:
//   temp_dir, memory_threshold, case_sensitive_fields, max_embedded_depth,
//   parse_errors_save_dir
// Unknown keys are ignored. Throws DocflowException(ConfigError) on a
// non-object or a wrongly typed value.
void load_importer_settings(const nlohmann::json& j, ImporterConfig& cfg);
void load_importer_settings_file(const std::filesystem::path& p, ImporterConfig& cfg);

// DOCFLOW_TEMP_DIR, DOCFLOW_MAX_MEMORY_BYTES, DOCFLOW_MAX_EMBEDDED_DEPTH
void apply_env_overrides(ImporterConfig& cfg);

nlohmann::json settings_to_json(const ImporterConfig& cfg);

} // namespace docflow
