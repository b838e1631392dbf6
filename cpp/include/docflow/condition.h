// docflow/cpp/include/docflow/condition.h
#pragma once
#include <regex>
#include <string>
#include <string_view>

#include "docflow/content_stream.h"
#include "docflow/event.h"
#include "docflow/handler.h"
#include "docflow/metadata.h"

namespace docflow {

// Whole-value regex match (ECMAScript), optionally case-insensitive.
class RegexMatch {
public:
    RegexMatch() = default;
    RegexMatch(std::string pattern, bool case_sensitive);

    bool matches(std::string_view value) const;

    const std::string& pattern() const { return pattern_; }
    bool case_sensitive() const { return case_sensitive_; }

    bool operator==(const RegexMatch& o) const {
        return pattern_ == o.pattern_ && case_sensitive_ == o.case_sensitive_;
    }

private:
    std::string pattern_;
    bool case_sensitive_{true};
    std::regex re_;
};

// Gates whether a handler step runs at all.
class RestrictionPredicate {
public:
    virtual ~RestrictionPredicate() = default;
    virtual bool matches(const Metadata& meta) const = 0;
    virtual std::string name() const = 0;
};

// True when any value of `field` matches the regex.
class MetadataRestriction : public RestrictionPredicate {
public:
    MetadataRestriction(std::string field, std::string regex, bool case_sensitive = false);

    bool matches(const Metadata& meta) const override;
    std::string name() const override;

    const std::string& field() const { return field_; }
    const RegexMatch& regex() const { return regex_; }

    bool operator==(const MetadataRestriction& o) const {
        return field_ == o.field_ && regex_ == o.regex_;
    }

private:
    std::string field_;
    RegexMatch regex_;
};

// Decides which branch of a conditional step runs.
class Condition {
public:
    virtual ~Condition() = default;
    virtual bool test(HandlerDoc& doc, ContentStream& content, ParseState state) = 0;
    virtual std::string name() const = 0;
};

class MetadataCondition : public Condition {
public:
    MetadataCondition(std::string field, std::string regex, bool case_sensitive = false)
        : restriction_(std::move(field), std::move(regex), case_sensitive) {}

    bool test(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    std::string name() const override;

private:
    MetadataRestriction restriction_;
};

class ReferenceCondition : public Condition {
public:
    explicit ReferenceCondition(std::string regex, bool case_sensitive = false)
        : regex_(std::move(regex), case_sensitive) {}

    bool test(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    std::string name() const override;

private:
    RegexMatch regex_;
};

// Blank content (field empty) or blank field values: every value blank
// or field missing.
class BlankCondition : public Condition {
public:
    BlankCondition() = default;
    explicit BlankCondition(std::string field) : field_(std::move(field)) {}

    bool test(HandlerDoc& doc, ContentStream& content, ParseState state) override;
    std::string name() const override;

private:
    std::string field_;
};

} // namespace docflow
