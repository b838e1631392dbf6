// docflow/cpp/src/response.cpp
#include "docflow/response.h"

#include <algorithm>

namespace docflow {

namespace {
const std::string EMPTY;
} // namespace

ImporterStatus ImporterStatus::rejected(std::shared_ptr<Filter> filter, std::string description) {
    ImporterStatus s;
    s.value_ = StatusRejected{std::move(filter), std::move(description)};
    return s;
}

ImporterStatus ImporterStatus::error(ErrorCode code, std::string detail, std::string description) {
    ImporterStatus s;
    s.value_ = StatusError{code, std::move(detail), std::move(description)};
    return s;
}

ImporterStatus::Status ImporterStatus::status() const {
    if (is_rejected()) return Status::Rejected;
    if (is_error()) return Status::Error;
    return Status::Success;
}

const std::string& ImporterStatus::description() const {
    if (const auto* r = std::get_if<StatusRejected>(&value_)) return r->description;
    if (const auto* e = std::get_if<StatusError>(&value_)) return e->description;
    return EMPTY;
}

const Filter* ImporterStatus::rejection_filter() const {
    const auto* r = std::get_if<StatusRejected>(&value_);
    return r ? r->filter.get() : nullptr;
}

const char* status_name(ImporterStatus::Status s) {
    switch (s) {
        case ImporterStatus::Status::Success: return "SUCCESS";
        case ImporterStatus::Status::Rejected: return "REJECTED";
        case ImporterStatus::Status::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// -------------------- ImporterResponse --------------------

ImporterResponse::ImporterResponse(std::string reference, ImporterStatus status)
    : reference_(std::move(reference)), status_(std::move(status)) {}

ImporterResponse::ImporterResponse(std::unique_ptr<Doc> doc)
    : status_(ImporterStatus::success()), doc_(std::move(doc)) {
    if (!doc_) throw ImporterException("successful response requires a document");
    reference_ = doc_->reference();
}

ImporterResponse& ImporterResponse::add_nested_response(std::unique_ptr<ImporterResponse> r) {
    if (!r) throw ImporterException("nested response must not be null");
    r->parent_ = this;
    nested_.push_back(std::move(r));
    return *nested_.back();
}

std::unique_ptr<ImporterResponse> ImporterResponse::remove_nested_response(const std::string& reference) {
    auto it = std::find_if(nested_.begin(), nested_.end(),
                           [&](const std::unique_ptr<ImporterResponse>& r) {
                               return r->reference() == reference;
                           });
    if (it == nested_.end()) return nullptr;
    std::unique_ptr<ImporterResponse> out = std::move(*it);
    nested_.erase(it);
    out->parent_ = nullptr;
    return out;
}

size_t ImporterResponse::depth() const {
    size_t d = 0;
    for (const ImporterResponse* p = parent_; p; p = p->parent_) ++d;
    return d;
}

void ImporterResponse::visit(const std::function<void(const ImporterResponse&)>& fn) const {
    fn(*this);
    for (const auto& n : nested_) n->visit(fn);
}

size_t ImporterResponse::tree_size() const {
    size_t n = 0;
    visit([&](const ImporterResponse&) { ++n; });
    return n;
}

// -------------------- json --------------------

nlohmann::json to_json(const ImporterStatus& s) {
    nlohmann::json j;
    j["status"] = status_name(s.status());
    if (s.is_success()) return j;

    j["description"] = s.description();
    if (const Filter* f = s.rejection_filter()) {
        j["filter"] = f->name();
        j["on_match"] = on_match_name(f->on_match());
    }
    if (const StatusError* e = s.error_info()) {
        j["code"] = error_code_name(e->code);
        j["detail"] = e->detail;
    }
    return j;
}

nlohmann::json to_json(const ImporterResponse& r) {
    nlohmann::json j;
    j["reference"] = r.reference();
    j["status"] = to_json(r.status());

    if (const Doc* d = r.document()) {
        nlohmann::json doc;
        doc["content_type"] = d->info().content_type;
        doc["content_encoding"] = d->info().content_encoding;
        doc["content_length"] = d->content().size();
        doc["embedded_parent_references"] = d->info().embedded_parent_references;

        nlohmann::json meta = nlohmann::json::object();
        for (const auto& e : d->metadata().entries()) {
            meta[e.first] = e.second;
        }
        doc["metadata"] = std::move(meta);
        j["document"] = std::move(doc);
    }

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& n : r.nested_responses()) {
        arr.push_back(to_json(*n));
    }
    j["nested_responses"] = std::move(arr);
    return j;
}

} // namespace docflow
