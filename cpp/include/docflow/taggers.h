// docflow/cpp/include/docflow/taggers.h
#pragma once
#include <string>
#include <vector>

#include "docflow/handler.h"

namespace docflow {

class ConstantTagger : public Tagger {
public:
    enum class Mode { Replace, Append, KeepExisting };

    ConstantTagger(std::string field, std::vector<std::string> values, Mode mode = Mode::Replace)
        : field_(std::move(field)), values_(std::move(values)), mode_(mode) {}

    void tag(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    std::string name() const override { return "ConstantTagger[" + field_ + "]"; }

private:
    std::string field_;
    std::vector<std::string> values_;
    Mode mode_;
};

// Content length in bytes into `field` (default "document.contentLength").
class DocumentLengthTagger : public Tagger {
public:
    explicit DocumentLengthTagger(std::string field = "document.contentLength")
        : field_(std::move(field)) {}

    void tag(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    std::string name() const override { return "DocumentLengthTagger[" + field_ + "]"; }

private:
    std::string field_;
};

} // namespace docflow
