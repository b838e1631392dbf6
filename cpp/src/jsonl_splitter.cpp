// docflow/cpp/src/jsonl_splitter.cpp
#include "docflow/splitters.h"
#include "docflow/log.h"

#include "text_common.h"

#include <simdjson.h>

#include <string_view>

namespace docflow {

namespace {

// string values verbatim, numbers and booleans in their JSON spelling,
// null as nothing
static bool scalar_to_string(const simdjson::dom::element& v, std::string& out) {
    switch (v.type()) {
        case simdjson::dom::element_type::STRING: {
            std::string_view sv;
            if (v.get(sv)) return false;
            out.assign(sv.data(), sv.size());
            return true;
        }
        case simdjson::dom::element_type::INT64:
        case simdjson::dom::element_type::UINT64:
        case simdjson::dom::element_type::DOUBLE:
        case simdjson::dom::element_type::BOOL:
            out = simdjson::minify(v);
            return true;
        default:
            return false;
    }
}

static std::vector<std::string> values_of(const simdjson::dom::element& v) {
    std::vector<std::string> out;
    std::string s;
    simdjson::dom::array arr;
    if (!v.get(arr)) {
        for (simdjson::dom::element item : arr) {
            if (scalar_to_string(item, s)) out.push_back(s);
        }
        return out;
    }
    if (scalar_to_string(v, s)) out.push_back(s);
    return out;
}

} // namespace

std::vector<std::unique_ptr<Doc>> JsonLinesSplitter::split(HandlerDoc& doc, ContentStream& in,
                                                           ContentWriter&, ParseState) {
    std::vector<std::unique_ptr<Doc>> children;

    const std::string data = in.read_all();
    simdjson::dom::parser parser;

    size_t line_no = 0;
    size_t skipped = 0;
    size_t start = 0;
    while (start < data.size()) {
        size_t nl = data.find('\n', start);
        if (nl == std::string::npos) nl = data.size();
        std::string line = data.substr(start, nl - start);
        start = nl + 1;
        ++line_no;

        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        simdjson::dom::element rec;
        simdjson::dom::object obj;
        if (parser.parse(line).get(rec) || rec.get(obj)) {
            log_debug("line " + std::to_string(line_no) + " of " + doc.reference() +
                      " is not a JSON object: " + safe_preview_utf8(line, 80));
            ++skipped;
            continue;
        }

        std::string id;
        simdjson::dom::element id_el;
        if (!obj.at_key(opt_.reference_field).get(id_el)) {
            scalar_to_string(id_el, id);
        }
        if (id.empty()) id = "line-" + std::to_string(line_no);

        std::string_view text_sv{};
        simdjson::dom::element text_el;
        if (!obj.at_key(opt_.content_field).get(text_el)) {
            if (text_el.get(text_sv)) text_sv = std::string_view{};
        }

        const std::string ref = doc.reference() + "!" + id;
        std::unique_ptr<Doc> child;
        if (opt_.keep_parent_metadata) {
            child = doc.new_child(ref, text_sv);
        } else {
            Metadata meta(doc.metadata().case_sensitive());
            meta.set(fields::REFERENCE, ref);
            child = std::make_unique<Doc>(DocInfo(ref), doc.streams().from_bytes(text_sv),
                                          std::move(meta));
        }

        Metadata& meta = child->metadata();
        for (auto field : obj) {
            const std::string key(field.key);
            if (key == opt_.content_field) continue;
            const auto vals = values_of(field.value);
            if (!vals.empty()) meta.set(key, vals);
        }
        meta.set(fields::EMBEDDED_REFERENCE, id);
        meta.set(fields::EMBEDDED_TYPE, "record");

        children.push_back(std::move(child));
    }

    if (skipped > 0) {
        log_warn("skipped " + std::to_string(skipped) + " malformed JSON line(s) in " +
                 doc.reference());
    }
    return children;
}

} // namespace docflow
