// docflow/cpp/include/docflow/doc.h
#pragma once
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "docflow/content_stream.h"
#include "docflow/metadata.h"

namespace docflow {

struct DocInfo {
    std::string reference;         // unique document id (URL, path, path#page2, ...)
    std::string content_type;      // e.g. "application/pdf"; empty => detect
    std::string content_encoding;  // e.g. "UTF-8"
    std::vector<std::string> embedded_parent_references; // root first, immediate parent last

    DocInfo() = default;
    explicit DocInfo(std::string ref) : reference(std::move(ref)) {}

    bool is_root() const { return embedded_parent_references.empty(); }

    bool operator==(const DocInfo& o) const {
        return reference == o.reference &&
               content_type == o.content_type &&
               content_encoding == o.content_encoding &&
               embedded_parent_references == o.embedded_parent_references;
    }
    bool operator!=(const DocInfo& o) const { return !(*this == o); }
};

std::ostream& operator<<(std::ostream& os, const DocInfo& info);

// Unit of work. Owns its content stream; replacing it disposes the old one.
class Doc {
public:
    Doc(DocInfo info, std::unique_ptr<ContentStream> content, Metadata meta = Metadata());

    Doc(const Doc&) = delete;
    Doc& operator=(const Doc&) = delete;

    const std::string& reference() const { return info_.reference; }

    DocInfo& info() { return info_; }
    const DocInfo& info() const { return info_; }

    Metadata& metadata() { return meta_; }
    const Metadata& metadata() const { return meta_; }

    ContentStream& content() { return *content_; }
    const ContentStream& content() const { return *content_; }

    void set_content(std::unique_ptr<ContentStream> content);

    // releases the content stream (memory + temp file)
    void dispose();

private:
    DocInfo info_;
    Metadata meta_;
    std::unique_ptr<ContentStream> content_;
};

} // namespace docflow
