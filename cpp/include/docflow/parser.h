// docflow/cpp/include/docflow/parser.h
#pragma once
#include <memory>
#include <string>
#include <vector>

#include "docflow/content_stream.h"
#include "docflow/doc.h"
#include "docflow/handler.h"

namespace docflow {

// Format decoder between the pre- and post-parse phases. Writes the
// extracted text to `out` (nothing written => empty content) and returns
// embedded documents, which are imported like splitter children.
// Throws on failure.
class Parser {
public:
    virtual ~Parser() = default;

    virtual std::string name() const = 0;
    virtual std::vector<std::unique_ptr<Doc>> parse(HandlerDoc& doc, ContentStream& in,
                                                    ContentWriter& out) = 0;
};

class ParserFactory {
public:
    virtual ~ParserFactory() = default;

    // null => the document is not parsed
    virtual std::shared_ptr<Parser> get_parser(const std::string& reference,
                                               const std::string& content_type) = 0;
};

// Plain text to UTF-8: valid UTF-8 is copied, anything else is decoded as
// CP1251. Sets document.contentEncoding to UTF-8.
class TextParser : public Parser {
public:
    std::string name() const override { return "TextParser"; }
    std::vector<std::unique_ptr<Doc>> parse(HandlerDoc& doc, ContentStream& in,
                                            ContentWriter& out) override;
};

// text/* => TextParser, everything else unparsed
class DefaultParserFactory : public ParserFactory {
public:
    DefaultParserFactory() : text_(std::make_shared<TextParser>()) {}

    std::shared_ptr<Parser> get_parser(const std::string& reference,
                                       const std::string& content_type) override;

private:
    std::shared_ptr<TextParser> text_;
};

} // namespace docflow
