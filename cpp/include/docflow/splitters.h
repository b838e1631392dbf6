// docflow/cpp/include/docflow/splitters.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "docflow/handler.h"

namespace docflow {

constexpr const char* PAGE_NUMBER_FIELD = "document.page.number";
constexpr const char* PAGE_COUNT_FIELD = "document.page.count";

// One child per form-feed separated page: "<ref><prefix><N>", N from 1.
// Single-page documents and documents that already are a page are left alone.
class PageSplitter : public Splitter {
public:
    explicit PageSplitter(std::string reference_page_prefix = "#page")
        : prefix_(std::move(reference_page_prefix)) {}

    std::vector<std::unique_ptr<Doc>> split(HandlerDoc& doc, ContentStream& in,
                                            ContentWriter& out, ParseState state) override;
    std::string name() const override { return "PageSplitter[" + prefix_ + "]"; }

private:
    std::string prefix_;
};

struct ZipSplitterOptions {
    size_t max_entries{20000};
    uint64_t max_total_uncompressed_bytes{10ull * 1024 * 1024 * 1024}; // 10 GiB safety cap
};

// One child per archive entry: "<ref>!<entry path>". Non-zip content is
// left alone.
class ZipSplitter : public Splitter {
public:
    explicit ZipSplitter(ZipSplitterOptions opt = ZipSplitterOptions()) : opt_(opt) {}

    std::vector<std::unique_ptr<Doc>> split(HandlerDoc& doc, ContentStream& in,
                                            ContentWriter& out, ParseState state) override;
    std::string name() const override { return "ZipSplitter"; }

private:
    ZipSplitterOptions opt_;
};

struct JsonLinesSplitterOptions {
    std::string reference_field{"id"};  // child reference suffix; "line-N" when absent
    std::string content_field{"text"};  // child content
    bool keep_parent_metadata{false};
};

// One child per JSON-lines record: "<ref>!<id>". Scalar fields (and arrays
// of scalars) other than the content field become metadata. Lines that do
// not parse as a JSON object are skipped.
class JsonLinesSplitter : public Splitter {
public:
    explicit JsonLinesSplitter(JsonLinesSplitterOptions opt = JsonLinesSplitterOptions())
        : opt_(std::move(opt)) {}

    std::vector<std::unique_ptr<Doc>> split(HandlerDoc& doc, ContentStream& in,
                                            ContentWriter& out, ParseState state) override;
    std::string name() const override { return "JsonLinesSplitter"; }

private:
    JsonLinesSplitterOptions opt_;
};

} // namespace docflow
