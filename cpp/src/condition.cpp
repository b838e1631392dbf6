// docflow/cpp/src/condition.cpp
#include "docflow/condition.h"
#include "docflow/errors.h"
#include "text_common.h"

namespace docflow {

RegexMatch::RegexMatch(std::string pattern, bool case_sensitive)
    : pattern_(std::move(pattern)), case_sensitive_(case_sensitive) {
    auto flags = std::regex::ECMAScript;
    if (!case_sensitive_) flags |= std::regex::icase;
    try {
        re_ = std::regex(pattern_, flags);
    } catch (const std::regex_error& e) {
        throw DocflowException(ErrorCode::ConfigError,
                               "invalid regex \"" + pattern_ + "\": " + e.what());
    }
}

bool RegexMatch::matches(std::string_view value) const {
    return std::regex_match(value.begin(), value.end(), re_);
}

MetadataRestriction::MetadataRestriction(std::string field, std::string regex, bool case_sensitive)
    : field_(std::move(field)), regex_(std::move(regex), case_sensitive) {}

bool MetadataRestriction::matches(const Metadata& meta) const {
    for (const auto& v : meta.get_all(field_)) {
        if (regex_.matches(v)) return true;
    }
    return false;
}

std::string MetadataRestriction::name() const {
    return "MetadataRestriction[" + field_ + "=~" + regex_.pattern() + "]";
}

bool MetadataCondition::test(HandlerDoc& doc, ContentStream&, ParseState) {
    return restriction_.matches(doc.metadata());
}

std::string MetadataCondition::name() const {
    return "MetadataCondition[" + restriction_.field() + "=~" + restriction_.regex().pattern() + "]";
}

bool ReferenceCondition::test(HandlerDoc& doc, ContentStream&, ParseState) {
    return regex_.matches(doc.reference());
}

std::string ReferenceCondition::name() const {
    return "ReferenceCondition[" + regex_.pattern() + "]";
}

bool BlankCondition::test(HandlerDoc& doc, ContentStream& content, ParseState) {
    if (field_.empty()) {
        if (content.empty()) return true;
        return is_blank(content.read_all());
    }
    for (const auto& v : doc.metadata().get_all(field_)) {
        if (!is_blank(v)) return false;
    }
    return true;
}

std::string BlankCondition::name() const {
    return field_.empty() ? "BlankCondition[content]" : "BlankCondition[" + field_ + "]";
}

} // namespace docflow
