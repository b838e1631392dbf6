// docflow/cpp/src/filters.cpp
#include "docflow/filters.h"

namespace docflow {

static bool accepted_for(bool matched, OnMatch on_match) {
    return on_match == OnMatch::Include ? matched : !matched;
}

MetadataFilter::MetadataFilter(std::string field, std::string regex, OnMatch on_match,
                               bool case_sensitive)
    : match_(std::move(field), std::move(regex), case_sensitive), on_match_(on_match) {}

bool MetadataFilter::accept(HandlerDoc& doc, ContentStream&, ParseState) {
    return accepted_for(match_.matches(doc.metadata()), on_match_);
}

std::string MetadataFilter::name() const {
    return std::string("MetadataFilter[") + on_match_name(on_match_) + " " +
           match_.field() + "=~" + match_.regex().pattern() + "]";
}

ReferenceFilter::ReferenceFilter(std::string regex, OnMatch on_match, bool case_sensitive)
    : regex_(std::move(regex), case_sensitive), on_match_(on_match) {}

bool ReferenceFilter::accept(HandlerDoc& doc, ContentStream&, ParseState) {
    return accepted_for(regex_.matches(doc.reference()), on_match_);
}

std::string ReferenceFilter::name() const {
    return std::string("ReferenceFilter[") + on_match_name(on_match_) + " " + regex_.pattern() + "]";
}

} // namespace docflow
