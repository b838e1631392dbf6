// docflow/cpp/include/docflow/handler.h
#pragma once
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "docflow/content_stream.h"
#include "docflow/doc.h"
#include "docflow/event.h"
#include "docflow/metadata.h"

namespace docflow {

// What a handler sees of the document: identity read-only, metadata
// mutable, content passed separately. The stream itself is only ever
// replaced by the executor.
class HandlerDoc {
public:
    HandlerDoc(Doc& doc, StreamFactory& streams) : doc_(doc), streams_(streams) {}

    const std::string& reference() const { return doc_.reference(); }
    const DocInfo& info() const { return doc_.info(); }
    Metadata& metadata() { return doc_.metadata(); }
    const Metadata& metadata() const { return doc_.metadata(); }
    StreamFactory& streams() { return streams_; }

    // New child document whose metadata starts as a copy of this one's.
    // Ancestry is stamped by the executor, not here.
    std::unique_ptr<Doc> new_child(const std::string& reference, std::string_view content);

private:
    Doc& doc_;
    StreamFactory& streams_;
};

class ImporterHandler {
public:
    virtual ~ImporterHandler() = default;

    // identity used in events, statuses and error messages
    virtual std::string name() const = 0;
};

// Reads/mutates metadata only.
class Tagger : public ImporterHandler {
public:
    virtual void tag(HandlerDoc& doc, ContentStream& content, ParseState state) = 0;
};

// Writes replacement content to `out`; writing nothing keeps the original.
class Transformer : public ImporterHandler {
public:
    virtual void transform(HandlerDoc& doc, ContentStream& in, ContentWriter& out,
                           ParseState state) = 0;
};

enum class OnMatch { Include, Exclude };

const char* on_match_name(OnMatch m);

class Filter : public ImporterHandler {
public:
    virtual bool accept(HandlerDoc& doc, ContentStream& content, ParseState state) = 0;

    // Include: at least one include filter of a phase must accept.
    // Exclude (default): rejecting rejects immediately.
    virtual OnMatch on_match() const { return OnMatch::Exclude; }
};

// Produces child documents. Writing to `out` rewrites the parent's own
// content; leaving it empty keeps it.
class Splitter : public ImporterHandler {
public:
    virtual std::vector<std::unique_ptr<Doc>> split(HandlerDoc& doc, ContentStream& in,
                                                    ContentWriter& out, ParseState state) = 0;
};

// Capability is fixed when the step is built.
using HandlerRef = std::variant<std::shared_ptr<Tagger>,
                                std::shared_ptr<Transformer>,
                                std::shared_ptr<Filter>,
                                std::shared_ptr<Splitter>>;

std::string handler_name(const HandlerRef& h);
const ImporterHandler* handler_ptr(const HandlerRef& h);

} // namespace docflow
