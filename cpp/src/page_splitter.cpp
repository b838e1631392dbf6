// docflow/cpp/src/page_splitter.cpp
#include "docflow/splitters.h"
#include "docflow/log.h"

namespace docflow {

std::vector<std::unique_ptr<Doc>> PageSplitter::split(HandlerDoc& doc, ContentStream& in,
                                                      ContentWriter&, ParseState) {
    std::vector<std::unique_ptr<Doc>> pages;

    // a page coming back through the pipeline is not split again
    if (doc.metadata().has(PAGE_NUMBER_FIELD)) return pages;

    const std::string text = in.read_all();
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t ff = text.find('\f', start);
        if (ff == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, ff - start));
        start = ff + 1;
    }
    // trailing form feed does not open a new page
    if (parts.size() > 1 && parts.back().empty()) parts.pop_back();

    if (parts.size() < 2) {
        log_debug("single page, not split: " + doc.reference());
        return pages;
    }

    const std::string count = std::to_string(parts.size());
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string page_no = std::to_string(i + 1);
        const std::string ref = doc.reference() + prefix_ + page_no;

        auto page = doc.new_child(ref, parts[i]);
        Metadata& meta = page->metadata();
        meta.set(fields::EMBEDDED_REFERENCE, page_no);
        meta.set(fields::EMBEDDED_TYPE, "page");
        meta.set(PAGE_NUMBER_FIELD, page_no);
        meta.set(PAGE_COUNT_FIELD, count);
        page->info().content_type = doc.info().content_type;
        pages.push_back(std::move(page));
    }
    return pages;
}

} // namespace docflow
