#include <cassert>
#include <ctime>
#include <filesystem>
#include <iostream>

#include <sqlite3.h>

#include "docflow/filters.h"
#include "docflow/importer.h"
#include "docflow/response_store.h"
#include "docflow/splitters.h"

using namespace docflow;

static std::filesystem::path mk_tmp_dir(const char* tag) {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("docflow_test_" + std::string(tag) + "_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::remove_all(p);
    std::filesystem::create_directories(p);
    return p;
}

int main() {
    auto dir = mk_tmp_dir("store");
    const auto db_path = (dir / "db" / "responses.sqlite").string();

    auto store = std::make_shared<SqliteResponseStore>(db_path);
    store->init();
    store->init(); // idempotent

    ImporterConfig cfg;
    std::vector<std::shared_ptr<RestrictionPredicate>> second_page = {
        std::make_shared<MetadataRestriction>(PAGE_NUMBER_FIELD, "2")};
    cfg.pre_parse_steps = {
        handler_step(std::make_shared<PageSplitter>()),
        handler_step(std::make_shared<RejectFilter>("blank page"), second_page),
    };
    cfg.response_processors = {store};
    Importer importer(cfg);

    auto r = importer.import_document(ImporterRequest::from_bytes("doc.pdf", "one\ftwo\fthree"));
    assert(r->is_success());
    assert(r->tree_size() == 4);

    assert(store->count() == 4);

    auto root = store->get("doc.pdf");
    assert(root);
    assert(root->status == "SUCCESS");
    assert(root->parent_reference.empty());
    assert(root->root_reference == "doc.pdf");
    assert(root->depth == 0);
    assert(root->content_type == "application/pdf");
    assert(!root->imported_at_utc.empty());

    auto children = store->list_children("doc.pdf");
    assert(children.size() == 3);
    assert(children[0].reference == "doc.pdf#page1");
    assert(children[1].status == "REJECTED");
    assert(children[1].description.find("blank page") != std::string::npos);
    assert(children[1].content_type.empty());
    assert(children[2].depth == 1);
    assert(children[2].root_reference == "doc.pdf");

    assert(!store->get("nope"));

    // importing again overwrites rows instead of duplicating them
    importer.import_document(ImporterRequest::from_bytes("doc.pdf", "one\ftwo\fthree"));
    assert(store->count() == 4);
    assert(store->list(2, 0).size() == 2);
    assert(store->list(10, 3).size() == 1);

    // rows are readable by any sqlite client
    sqlite3* db = nullptr;
    assert(sqlite3_open(db_path.c_str(), &db) == SQLITE_OK);
    sqlite3_stmt* st = nullptr;
    assert(sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM responses WHERE status='REJECTED';", -1, &st, nullptr) ==
           SQLITE_OK);
    assert(sqlite3_step(st) == SQLITE_ROW);
    assert(sqlite3_column_int(st, 0) == 1);
    sqlite3_finalize(st);
    sqlite3_close(db);

    std::cout << "OK\n";
    return 0;
}
