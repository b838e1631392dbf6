// docflow/cpp/src/parser.cpp
#include "docflow/parser.h"
#include "docflow/content_type.h"
#include "docflow/log.h"

#include "text_common.h"

namespace docflow {

std::vector<std::unique_ptr<Doc>> TextParser::parse(HandlerDoc& doc, ContentStream& in,
                                                    ContentWriter& out) {
    const std::string raw = in.read_all();

    // strip UTF-8 BOM
    std::string_view body(raw);
    if (body.size() >= 3 && (unsigned char)body[0] == 0xEF && (unsigned char)body[1] == 0xBB &&
        (unsigned char)body[2] == 0xBF) {
        body.remove_prefix(3);
    }

    if (utf8_is_valid(body)) {
        out.write(body);
    } else {
        log_debug("not valid UTF-8, decoding as CP1251: " + doc.reference());
        out.write(cp1251_to_utf8(body));
    }
    doc.metadata().set(fields::CONTENT_ENCODING, "UTF-8");
    return {};
}

std::shared_ptr<Parser> DefaultParserFactory::get_parser(const std::string&,
                                                         const std::string& content_type) {
    const std::string base = base_content_type(content_type);
    if (base.rfind("text/", 0) == 0) return text_;
    return nullptr;
}

} // namespace docflow
