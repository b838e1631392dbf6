#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include "docflow/condition.h"
#include "docflow/errors.h"
#include "docflow/filters.h"
#include "docflow/parser.h"
#include "docflow/splitters.h"
#include "docflow/taggers.h"
#include "docflow/transformers.h"

using namespace docflow;

static std::filesystem::path test_data_file(const char* name) {
#ifndef DOCFLOW_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name;
#else
    return std::filesystem::path(DOCFLOW_TEST_DATA_DIR) / name;
#endif
}

static std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    assert(in);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void test_taggers(StreamFactory& f) {
    Doc doc(DocInfo("t.txt"), f.from_bytes("12345"));
    HandlerDoc hd(doc, f);

    ConstantTagger("k", {"a"}).tag(hd, doc.content(), ParseState::Pre);
    ConstantTagger("k", {"b", "c"}, ConstantTagger::Mode::Append).tag(hd, doc.content(), ParseState::Pre);
    assert((doc.metadata().get_all("k") == std::vector<std::string>{"a", "b", "c"}));

    ConstantTagger("k", {"z"}, ConstantTagger::Mode::KeepExisting).tag(hd, doc.content(), ParseState::Pre);
    assert(doc.metadata().get_all("k").size() == 3);

    ConstantTagger("k", {"z"}).tag(hd, doc.content(), ParseState::Pre);
    assert((doc.metadata().get_all("k") == std::vector<std::string>{"z"}));

    DocumentLengthTagger().tag(hd, doc.content(), ParseState::Post);
    assert(doc.metadata().get("document.contentLength") == "5");
}

static void test_replace_transformer(StreamFactory& f) {
    Doc doc(DocInfo("t.txt"), f.from_bytes("Colour and colour"));
    HandlerDoc hd(doc, f);

    auto out = f.new_writer();
    ReplaceTransformer("colou?r", "color", false).transform(hd, doc.content(), *out, ParseState::Post);
    assert(out->to_stream()->read_all() == "color and color");

    auto none = f.new_writer();
    ReplaceTransformer("xyz", "abc").transform(hd, doc.content(), *none, ParseState::Post);
    assert(none->empty());

    bool threw = false;
    try {
        ReplaceTransformer("(unclosed", "x");
    } catch (const DocflowException& e) {
        threw = (e.code() == ErrorCode::ConfigError);
    }
    assert(threw);
}

static void test_filters(StreamFactory& f) {
    Doc doc(DocInfo("dir/report.PDF"), f.from_bytes(""));
    doc.metadata().set(fields::CONTENT_TYPE, "application/pdf");
    HandlerDoc hd(doc, f);

    MetadataFilter exclude_pdf(fields::CONTENT_TYPE, "application/pdf");
    assert(!exclude_pdf.accept(hd, doc.content(), ParseState::Pre));
    assert(exclude_pdf.on_match() == OnMatch::Exclude);
    assert(exclude_pdf.name() == "MetadataFilter[exclude document.contentType=~application/pdf]");

    MetadataFilter include_pdf(fields::CONTENT_TYPE, "application/pdf", OnMatch::Include);
    assert(include_pdf.accept(hd, doc.content(), ParseState::Pre));

    MetadataFilter missing("no.such.field", ".*", OnMatch::Include);
    assert(!missing.accept(hd, doc.content(), ParseState::Pre));

    ReferenceFilter by_ref(".*\\.pdf", OnMatch::Include);
    assert(by_ref.accept(hd, doc.content(), ParseState::Pre));
    ReferenceFilter by_ref_cs(".*\\.pdf", OnMatch::Include, true);
    assert(!by_ref_cs.accept(hd, doc.content(), ParseState::Pre));

    RejectFilter reject;
    assert(!reject.accept(hd, doc.content(), ParseState::Pre));
}

static void test_conditions(StreamFactory& f) {
    Doc blank(DocInfo("b.txt"), f.from_bytes(" \n\t "));
    HandlerDoc hb(blank, f);
    assert(BlankCondition().test(hb, blank.content(), ParseState::Pre));
    assert(BlankCondition("title").test(hb, blank.content(), ParseState::Pre));

    blank.metadata().add("title", " ");
    assert(BlankCondition("title").test(hb, blank.content(), ParseState::Pre));
    blank.metadata().add("title", "Real title");
    assert(!BlankCondition("title").test(hb, blank.content(), ParseState::Pre));

    Doc full(DocInfo("f.txt"), f.from_bytes("text"));
    HandlerDoc hf(full, f);
    assert(!BlankCondition().test(hf, full.content(), ParseState::Pre));

    bool threw = false;
    try {
        MetadataCondition("x", "[bad");
    } catch (const DocflowException& e) {
        threw = (e.code() == ErrorCode::ConfigError);
    }
    assert(threw);
}

static void test_text_parser(StreamFactory& f) {
    Doc doc(DocInfo("cp1251.txt"), f.open_file(test_data_file("cp1251.txt")));
    HandlerDoc hd(doc, f);
    TextParser parser;
    auto out = f.new_writer();
    auto embedded = parser.parse(hd, doc.content(), *out);
    assert(embedded.empty());
    assert(out->to_stream()->read_all() == "Привет, мир");
    assert(doc.metadata().get(fields::CONTENT_ENCODING) == "UTF-8");

    Doc utf(DocInfo("bom.txt"), f.from_bytes("\xEF\xBB\xBFkeep"));
    HandlerDoc hu(utf, f);
    auto out2 = f.new_writer();
    parser.parse(hu, utf.content(), *out2);
    assert(out2->to_stream()->read_all() == "keep");

    DefaultParserFactory factory;
    assert(factory.get_parser("a.txt", "text/plain; charset=UTF-8") != nullptr);
    assert(factory.get_parser("a.csv", "text/csv") != nullptr);
    assert(factory.get_parser("a.pdf", "application/pdf") == nullptr);

    assert(read_file(test_data_file("sample.txt")).find("docflow") != std::string::npos);
}

static void test_page_splitter(StreamFactory& f) {
    Doc doc(DocInfo("doc.pdf"), f.from_bytes("one\ftwo\fthree\f"));
    doc.info().content_type = "application/pdf";
    doc.metadata().set("author", "Ann");
    HandlerDoc hd(doc, f);

    PageSplitter splitter;
    auto out = f.new_writer();
    auto pages = splitter.split(hd, doc.content(), *out, ParseState::Post);
    assert(out->empty());
    assert(pages.size() == 3);
    assert(pages[0]->reference() == "doc.pdf#page1");
    assert(pages[2]->reference() == "doc.pdf#page3");
    assert(pages[1]->content().read_all() == "two");
    assert(pages[1]->metadata().get(PAGE_NUMBER_FIELD) == "2");
    assert(pages[1]->metadata().get(PAGE_COUNT_FIELD) == "3");
    assert(pages[1]->metadata().get("author") == "Ann");
    assert(pages[1]->info().content_type == "application/pdf");

    // a page is never split again
    HandlerDoc hp(*pages[0], f);
    auto out2 = f.new_writer();
    assert(splitter.split(hp, pages[0]->content(), *out2, ParseState::Post).empty());

    Doc single(DocInfo("one.pdf"), f.from_bytes("only page"));
    HandlerDoc hs(single, f);
    auto out3 = f.new_writer();
    assert(PageSplitter("/p").split(hs, single.content(), *out3, ParseState::Post).empty());
}

int main() {
    StreamFactory f;
    test_taggers(f);
    test_replace_transformer(f);
    test_filters(f);
    test_conditions(f);
    test_text_parser(f);
    test_page_splitter(f);

    std::cout << "OK\n";
    return 0;
}
