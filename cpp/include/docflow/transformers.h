// docflow/cpp/include/docflow/transformers.h
#pragma once
#include <regex>
#include <string>

#include "docflow/handler.h"

namespace docflow {

// Regex replacement over the whole content text ($1-style back references).
// No match => nothing written => content unchanged.
class ReplaceTransformer : public Transformer {
public:
    ReplaceTransformer(std::string regex, std::string replacement, bool case_sensitive = true);

    void transform(HandlerDoc& doc, ContentStream& in, ContentWriter& out,
                   ParseState state) override;
    std::string name() const override { return "ReplaceTransformer[" + pattern_ + "]"; }

private:
    std::string pattern_;
    std::string replacement_;
    std::regex re_;
};

} // namespace docflow
