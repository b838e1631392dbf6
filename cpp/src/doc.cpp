// docflow/cpp/src/doc.cpp
#include "docflow/doc.h"
#include "docflow/errors.h"

namespace docflow {

std::ostream& operator<<(std::ostream& os, const DocInfo& info) {
    os << "DocInfo[reference=" << info.reference;
    if (!info.content_type.empty()) os << ",contentType=" << info.content_type;
    if (!info.content_encoding.empty()) os << ",contentEncoding=" << info.content_encoding;
    if (!info.embedded_parent_references.empty()) {
        os << ",embeddedParentReferences=[";
        for (size_t i = 0; i < info.embedded_parent_references.size(); ++i) {
            if (i) os << ",";
            os << info.embedded_parent_references[i];
        }
        os << "]";
    }
    return os << "]";
}

Doc::Doc(DocInfo info, std::unique_ptr<ContentStream> content, Metadata meta)
    : info_(std::move(info)), meta_(std::move(meta)), content_(std::move(content)) {
    if (!content_) throw ImporterException("document content must not be null: " + info_.reference);
}

void Doc::set_content(std::unique_ptr<ContentStream> content) {
    if (!content) throw ImporterException("document content must not be null: " + info_.reference);
    if (content.get() == content_.get()) return;
    content_->dispose();
    content_ = std::move(content);
}

void Doc::dispose() {
    content_->dispose();
}

} // namespace docflow
