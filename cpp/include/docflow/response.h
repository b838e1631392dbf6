// docflow/cpp/include/docflow/response.h
#pragma once
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "docflow/doc.h"
#include "docflow/errors.h"
#include "docflow/handler.h"

namespace docflow {

struct StatusSuccess {};

struct StatusRejected {
    std::shared_ptr<Filter> filter; // null when no include filter matched
    std::string description;
};

struct StatusError {
    ErrorCode code{ErrorCode::Ok};
    std::string detail;      // what() of the underlying exception
    std::string description;
};

class ImporterStatus {
public:
    enum class Status { Success, Rejected, Error };

    ImporterStatus() : value_(StatusSuccess{}) {}

    static ImporterStatus success() { return ImporterStatus(); }
    static ImporterStatus rejected(std::shared_ptr<Filter> filter, std::string description);
    static ImporterStatus error(ErrorCode code, std::string detail, std::string description);

    Status status() const;
    bool is_success() const { return std::holds_alternative<StatusSuccess>(value_); }
    bool is_rejected() const { return std::holds_alternative<StatusRejected>(value_); }
    bool is_error() const { return std::holds_alternative<StatusError>(value_); }

    // "" on success
    const std::string& description() const;

    // non-null only for a rejection caused by a specific filter
    const Filter* rejection_filter() const;
    const StatusError* error_info() const { return std::get_if<StatusError>(&value_); }

    const std::variant<StatusSuccess, StatusRejected, StatusError>& value() const { return value_; }

private:
    std::variant<StatusSuccess, StatusRejected, StatusError> value_;
};

// "SUCCESS", "REJECTED", "ERROR"
const char* status_name(ImporterStatus::Status s);

// One node per imported document. Owns its nested responses; the parent
// back-link is set by add_nested_response().
class ImporterResponse {
public:
    ImporterResponse(std::string reference, ImporterStatus status);
    explicit ImporterResponse(std::unique_ptr<Doc> doc);

    ImporterResponse(const ImporterResponse&) = delete;
    ImporterResponse& operator=(const ImporterResponse&) = delete;

    const std::string& reference() const { return reference_; }
    const ImporterStatus& status() const { return status_; }
    bool is_success() const { return status_.is_success(); }

    // present iff SUCCESS
    Doc* document() { return doc_.get(); }
    const Doc* document() const { return doc_.get(); }
    std::unique_ptr<Doc> release_document() { return std::move(doc_); }

    ImporterResponse* parent_response() const { return parent_; }
    const std::vector<std::unique_ptr<ImporterResponse>>& nested_responses() const { return nested_; }

    ImporterResponse& add_nested_response(std::unique_ptr<ImporterResponse> r);
    std::unique_ptr<ImporterResponse> remove_nested_response(const std::string& reference);

    // 0 for the root
    size_t depth() const;

    // pre-order walk over this node and all descendants
    void visit(const std::function<void(const ImporterResponse&)>& fn) const;
    size_t tree_size() const;

private:
    std::string reference_;
    ImporterStatus status_;
    std::unique_ptr<Doc> doc_;
    std::vector<std::unique_ptr<ImporterResponse>> nested_;
    ImporterResponse* parent_{nullptr};
};

// Runs once per root response, after the whole tree is assembled.
class ResponseProcessor {
public:
    virtual ~ResponseProcessor() = default;
    virtual void process(ImporterResponse& response) = 0;
};

nlohmann::json to_json(const ImporterStatus& s);
nlohmann::json to_json(const ImporterResponse& r);

} // namespace docflow
