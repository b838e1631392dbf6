// docflow/cpp/include/docflow/metadata.h
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace docflow {

// Field names the pipeline itself reads or writes.
namespace fields {
constexpr const char* REFERENCE = "document.reference";
constexpr const char* CONTENT_TYPE = "document.contentType";
constexpr const char* CONTENT_ENCODING = "document.contentEncoding";
constexpr const char* CONTENT_FAMILY = "document.contentFamily";
constexpr const char* IMPORTED_DATE = "document.importedDate";

constexpr const char* EMBEDDED_PARENT_REFERENCE = "document.embedded.parent.reference";
constexpr const char* EMBEDDED_ANCESTOR_REFERENCES = "document.embedded.ancestor.references";
constexpr const char* EMBEDDED_INDEX = "document.embedded.index";
constexpr const char* EMBEDDED_REFERENCE = "document.embedded.reference";
constexpr const char* EMBEDDED_TYPE = "document.embedded.type";
} // namespace fields

// Ordered multi-valued string map. Fields keep their first insertion order;
// values keep the order they were added in.
class Metadata {
public:
    using Entry = std::pair<std::string, std::vector<std::string>>;

    explicit Metadata(bool case_sensitive = true) : case_sensitive_(case_sensitive) {}

    bool case_sensitive() const { return case_sensitive_; }

    void add(const std::string& field, const std::string& value);
    void add(const std::string& field, const std::vector<std::string>& values);

    // replaces every existing value
    void set(const std::string& field, const std::string& value);
    void set(const std::string& field, const std::vector<std::string>& values);

    // first value, or "" when absent
    std::string get(const std::string& field) const;
    std::vector<std::string> get_all(const std::string& field) const;

    bool has(const std::string& field) const;
    bool remove(const std::string& field);
    void clear() { entries_.clear(); }

    // copies every field of `other`, replacing same-named fields here
    void load_from(const Metadata& other);

    std::vector<std::string> fields() const;
    const std::vector<Entry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    bool operator==(const Metadata& o) const;
    bool operator!=(const Metadata& o) const { return !(*this == o); }

private:
    bool same_field(const std::string& a, const std::string& b) const;
    Entry* find(const std::string& field);
    const Entry* find(const std::string& field) const;

    bool case_sensitive_{true};
    std::vector<Entry> entries_;
};

} // namespace docflow
