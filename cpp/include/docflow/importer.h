// docflow/cpp/include/docflow/importer.h
#pragma once
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "docflow/config.h"
#include "docflow/content_stream.h"
#include "docflow/doc.h"
#include "docflow/event.h"
#include "docflow/metadata.h"
#include "docflow/response.h"

namespace docflow {

// One document to import. At most one content source is used, in this
// order: stream, file, bytes; none gives an empty document.
struct ImporterRequest {
    std::string reference;         // defaults to the absolute file path for file requests
    std::string content_type;      // empty => detected
    std::string content_encoding;
    Metadata metadata;

    std::istream* stream{nullptr}; // not owned; read to the end during import
    std::filesystem::path file;
    std::optional<std::string> bytes;

    static ImporterRequest from_bytes(std::string reference, std::string content);
    static ImporterRequest from_file(std::filesystem::path p, std::string reference = {});
    static ImporterRequest from_stream(std::istream& in, std::string reference);
};

// Runs documents through the configured pipeline:
//   detect type -> pre-parse steps -> parser -> post-parse steps -> children
// Every failure ends up as an ERROR response; nothing escapes import_document.
class Importer {
public:
    explicit Importer(ImporterConfig config = ImporterConfig(), EventManager events = EventManager());

    Importer(const Importer&) = delete;
    Importer& operator=(const Importer&) = delete;

    std::unique_ptr<ImporterResponse> import_document(const ImporterRequest& req);
    std::unique_ptr<ImporterResponse> import_document(std::unique_ptr<Doc> doc);

    const ImporterConfig& config() const { return cfg_; }
    EventManager& events() { return events_; }
    StreamFactory& streams() { return streams_; }

private:
    std::unique_ptr<Doc> to_document(const ImporterRequest& req);

    std::unique_ptr<ImporterResponse> import_tree(std::unique_ptr<Doc> doc);
    ImporterStatus process_document(Doc& doc, std::vector<std::unique_ptr<Doc>>& children);
    void prepare_document(Doc& doc);
    void parse_document(Doc& doc, std::vector<std::unique_ptr<Doc>>& children);
    void save_parse_error(Doc& doc, const std::string& parser, const std::string& what);
    void process_response(ImporterResponse& response);

    void fire(EventType type, const Doc& doc, const std::string& subject, ParseState state,
              const std::string& error = std::string()) const;

    ImporterConfig cfg_;
    EventManager events_;
    StreamFactory streams_;
};

} // namespace docflow
