// docflow/cpp/include/docflow/response_store.h
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "docflow/response.h"

namespace docflow {

struct ResponseRow {
    std::string reference;
    std::string parent_reference;  // "" for roots
    std::string root_reference;
    std::string status;            // SUCCESS / REJECTED / ERROR
    std::string description;
    std::string content_type;      // "" unless SUCCESS
    int depth{0};
    std::string imported_at_utc;
};

// Response processor that records every node of a response tree in an
// SQLite table, one row per reference (re-imports overwrite).
class SqliteResponseStore : public ResponseProcessor {
public:
    explicit SqliteResponseStore(const std::string& db_path);
    ~SqliteResponseStore() override;

    SqliteResponseStore(const SqliteResponseStore&) = delete;
    SqliteResponseStore& operator=(const SqliteResponseStore&) = delete;

    void init();

    void process(ImporterResponse& response) override;

    void upsert_rows(const std::vector<ResponseRow>& rows);

    std::optional<ResponseRow> get(const std::string& reference);
    std::vector<ResponseRow> list_children(const std::string& parent_reference);
    std::vector<ResponseRow> list(int limit, int offset);
    int64_t count();

private:
    void* db_{nullptr}; // sqlite3*
    std::string path_;
};

// flattens a response tree in pre-order
std::vector<ResponseRow> response_rows(const ImporterResponse& root);

} // namespace docflow
