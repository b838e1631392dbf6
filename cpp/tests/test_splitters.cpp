#include <cassert>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <zip.h>

#include "docflow/importer.h"
#include "docflow/splitters.h"

using namespace docflow;

static std::filesystem::path mk_tmp_dir(const char* tag) {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("docflow_test_" + std::string(tag) + "_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
}

static std::filesystem::path test_data_file(const char* name) {
#ifndef DOCFLOW_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name;
#else
    return std::filesystem::path(DOCFLOW_TEST_DATA_DIR) / name;
#endif
}

struct Entry {
    std::string name;
    std::string data;
};

static std::filesystem::path make_zip(const std::filesystem::path& p, const std::vector<Entry>& entries,
                                      bool with_dir) {
    int err = 0;
    zip_t* za = zip_open(p.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    assert(za);
    if (with_dir) assert(zip_dir_add(za, "docs", ZIP_FL_ENC_UTF_8) >= 0);
    for (const auto& e : entries) {
        zip_source_t* src = zip_source_buffer(za, e.data.data(), e.data.size(), 0);
        assert(src);
        assert(zip_file_add(za, e.name.c_str(), src, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) >= 0);
    }
    // entry buffers are read here
    assert(zip_close(za) == 0);
    return p;
}

static void test_zip_entries_become_children() {
    auto dir = mk_tmp_dir("zip");
    const std::vector<Entry> entries = {
        {"readme.txt", "read me first"},
        {"docs/guide.txt", "a guide"},
        {"../escape.txt", "should be skipped"},
    };
    auto zip_path = make_zip(dir / "bundle.zip", entries, true);

    ImporterConfig cfg;
    cfg.pre_parse_steps = {handler_step(std::make_shared<ZipSplitter>())};
    Importer importer(cfg);

    auto r = importer.import_document(ImporterRequest::from_file(zip_path, "bundle.zip"));
    assert(r->is_success());
    assert(r->document()->info().content_type == "application/zip");
    assert(r->document()->metadata().get(fields::CONTENT_FAMILY) == "archive");
    assert(r->nested_responses().size() == 2);

    const ImporterResponse& a = *r->nested_responses()[0];
    const ImporterResponse& b = *r->nested_responses()[1];
    assert(a.reference() == "bundle.zip!readme.txt");
    assert(b.reference() == "bundle.zip!docs/guide.txt");
    assert(a.is_success() && b.is_success());
    assert(a.document()->content().read_all() == "read me first");
    assert(a.document()->info().content_type == "text/plain");
    assert(a.document()->metadata().get(fields::EMBEDDED_REFERENCE) == "readme.txt");
    assert(a.document()->metadata().get(fields::EMBEDDED_TYPE) == "archive-entry");
    assert(b.document()->metadata().get(fields::EMBEDDED_INDEX) == "1");
    assert((b.document()->info().embedded_parent_references == std::vector<std::string>{"bundle.zip"}));
}

static void test_zip_limits_and_non_zip() {
    auto dir = mk_tmp_dir("zip_limits");
    auto zip_path = make_zip(dir / "many.zip", {{"a.txt", "a"}, {"b.txt", "b"}, {"c.txt", "c"}}, false);

    ZipSplitterOptions opt;
    opt.max_entries = 2;
    ImporterConfig cfg;
    cfg.pre_parse_steps = {handler_step(std::make_shared<ZipSplitter>(opt))};
    Importer importer(cfg);

    auto r = importer.import_document(ImporterRequest::from_file(zip_path, "many.zip"));
    assert(r->status().is_error());
    assert(r->status().description().find("ZipSplitter") != std::string::npos);

    ZipSplitterOptions tiny;
    tiny.max_total_uncompressed_bytes = 2;
    ImporterConfig cfg2;
    cfg2.pre_parse_steps = {handler_step(std::make_shared<ZipSplitter>(tiny))};
    Importer importer2(cfg2);
    assert(importer2.import_document(ImporterRequest::from_file(zip_path, "many.zip"))->status().is_error());

    // not an archive: left alone
    auto plain = importer.import_document(ImporterRequest::from_bytes("fake.zip", "not a zip"));
    assert(plain->is_success());
    assert(plain->nested_responses().empty());
}

static void test_json_lines_records() {
    ImporterConfig cfg;
    cfg.pre_parse_steps = {handler_step(std::make_shared<JsonLinesSplitter>())};
    Importer importer(cfg);

    auto r = importer.import_document(ImporterRequest::from_file(test_data_file("records.jsonl"), "records.jsonl"));
    assert(r->is_success());
    assert(r->document()->info().content_type == "application/x-ndjson");
    assert(r->nested_responses().size() == 3);

    const Doc* r1 = r->nested_responses()[0]->document();
    assert(r1->reference() == "records.jsonl!r1");
    assert(r1->content().read_all() == "first record body");
    assert(r1->metadata().get("author") == "Ann");
    assert(r1->metadata().get("year") == "2019");
    assert((r1->metadata().get_all("tags") == std::vector<std::string>{"a", "b"}));
    assert(!r1->metadata().has("text"));
    assert(r1->metadata().get(fields::EMBEDDED_TYPE) == "record");

    const Doc* r2 = r->nested_responses()[1]->document();
    assert(r2->metadata().get("draft") == "true");

    const Doc* r3 = r->nested_responses()[2]->document();
    assert(r3->reference() == "records.jsonl!line-4");
    assert(r3->metadata().get("author") == "Cy");
    assert(r3->metadata().get(fields::EMBEDDED_INDEX) == "2");
}

static void test_json_lines_custom_fields() {
    StreamFactory f;
    Doc doc(DocInfo("feed.jsonl"),
            f.from_bytes("{\"uid\":7,\"body\":\"seven\",\"text\":\"kept as metadata\"}\n"));
    doc.metadata().set("source", "feed");
    HandlerDoc hd(doc, f);

    JsonLinesSplitterOptions opt;
    opt.reference_field = "uid";
    opt.content_field = "body";
    opt.keep_parent_metadata = true;
    JsonLinesSplitter splitter(opt);

    auto out = f.new_writer();
    auto children = splitter.split(hd, doc.content(), *out, ParseState::Pre);
    assert(children.size() == 1);
    assert(children[0]->reference() == "feed.jsonl!7");
    assert(children[0]->content().read_all() == "seven");
    assert(children[0]->metadata().get("source") == "feed");
    assert(children[0]->metadata().get("text") == "kept as metadata");
    assert(!children[0]->metadata().has("body"));
}

int main() {
    test_zip_entries_become_children();
    test_zip_limits_and_non_zip();
    test_json_lines_records();
    test_json_lines_custom_fields();

    std::cout << "OK\n";
    return 0;
}
