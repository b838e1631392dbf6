// docflow/cpp/include/docflow/filters.h
#pragma once
#include <string>

#include "docflow/condition.h"
#include "docflow/handler.h"

namespace docflow {

// Matches when any value of `field` matches the regex. A missing field
// never matches.
class MetadataFilter : public Filter {
public:
    MetadataFilter(std::string field, std::string regex,
                   OnMatch on_match = OnMatch::Exclude, bool case_sensitive = false);

    bool accept(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    OnMatch on_match() const override { return on_match_; }
    std::string name() const override;

private:
    MetadataRestriction match_;
    OnMatch on_match_;
};

class ReferenceFilter : public Filter {
public:
    explicit ReferenceFilter(std::string regex, OnMatch on_match = OnMatch::Exclude,
                             bool case_sensitive = false);

    bool accept(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    OnMatch on_match() const override { return on_match_; }
    std::string name() const override;

private:
    RegexMatch regex_;
    OnMatch on_match_;
};

// Always rejects; backs the flow's reject step.
class RejectFilter : public Filter {
public:
    explicit RejectFilter(std::string description = "Rejected by flow.")
        : description_(std::move(description)) {}

    bool accept(HandlerDoc&, ContentStream&, ParseState) override { return false; }
    std::string name() const override { return "RejectFilter[" + description_ + "]"; }

private:
    std::string description_;
};

} // namespace docflow
