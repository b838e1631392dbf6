// docflow/cpp/src/transformers.cpp
#include "docflow/transformers.h"
#include "docflow/errors.h"

namespace docflow {

ReplaceTransformer::ReplaceTransformer(std::string regex, std::string replacement, bool case_sensitive)
    : pattern_(std::move(regex)), replacement_(std::move(replacement)) {
    auto flags = std::regex::ECMAScript;
    if (!case_sensitive) flags |= std::regex::icase;
    try {
        re_ = std::regex(pattern_, flags);
    } catch (const std::regex_error& e) {
        throw DocflowException(ErrorCode::ConfigError,
                               "invalid regex \"" + pattern_ + "\": " + e.what());
    }
}

void ReplaceTransformer::transform(HandlerDoc&, ContentStream& in, ContentWriter& out, ParseState) {
    const std::string text = in.read_all();
    if (!std::regex_search(text, re_)) return;
    out.write(std::regex_replace(text, re_, replacement_));
}

} // namespace docflow
