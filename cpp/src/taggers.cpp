// docflow/cpp/src/taggers.cpp
#include "docflow/taggers.h"

namespace docflow {

void ConstantTagger::tag(HandlerDoc& doc, ContentStream&, ParseState) {
    Metadata& meta = doc.metadata();
    switch (mode_) {
        case Mode::Replace:
            meta.set(field_, values_);
            break;
        case Mode::Append:
            meta.add(field_, values_);
            break;
        case Mode::KeepExisting:
            if (!meta.has(field_)) meta.set(field_, values_);
            break;
    }
}

void DocumentLengthTagger::tag(HandlerDoc& doc, ContentStream& content, ParseState) {
    doc.metadata().set(field_, std::to_string(content.size()));
}

} // namespace docflow
