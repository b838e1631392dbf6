// docflow/cpp/include/docflow/content_type.h
#pragma once
#include <string>

#include "docflow/content_stream.h"

namespace docflow {

constexpr const char* OCTET_STREAM = "application/octet-stream";

class ContentTypeDetector {
public:
    virtual ~ContentTypeDetector() = default;

    // stream is rewound before and after; may throw StreamException
    virtual std::string detect(ContentStream& content, const std::string& reference) = 0;
};

// Leading magic bytes first, then the reference's file extension.
class DefaultContentTypeDetector : public ContentTypeDetector {
public:
    std::string detect(ContentStream& content, const std::string& reference) override;
};

std::string content_type_from_extension(const std::string& reference);

// "text", "pdf", "archive", "image", "spreadsheet", "word_processor",
// "presentation", "html", "xml", "json", or "" when unknown
std::string content_family(const std::string& content_type);

// "application/pdf; charset=x" -> "application/pdf"
std::string base_content_type(const std::string& content_type);

} // namespace docflow
