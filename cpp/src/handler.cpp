// docflow/cpp/src/handler.cpp
#include "docflow/handler.h"

namespace docflow {

std::unique_ptr<Doc> HandlerDoc::new_child(const std::string& reference, std::string_view content) {
    Metadata meta(doc_.metadata().case_sensitive());
    meta.load_from(doc_.metadata());
    meta.set(fields::REFERENCE, reference);
    // the child gets its own type detection
    meta.remove(fields::CONTENT_TYPE);
    meta.remove(fields::CONTENT_FAMILY);
    meta.remove(fields::CONTENT_ENCODING);
    return std::make_unique<Doc>(DocInfo(reference), streams_.from_bytes(content), std::move(meta));
}

const char* on_match_name(OnMatch m) {
    return m == OnMatch::Include ? "include" : "exclude";
}

const ImporterHandler* handler_ptr(const HandlerRef& h) {
    return std::visit([](const auto& p) -> const ImporterHandler* { return p.get(); }, h);
}

std::string handler_name(const HandlerRef& h) {
    const ImporterHandler* p = handler_ptr(h);
    return p ? p->name() : std::string("<null>");
}

} // namespace docflow
