#include <cassert>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>

#include "docflow/doc.h"
#include "docflow/errors.h"
#include "docflow/metadata.h"
#include "docflow/response.h"

static std::filesystem::path mk_tmp_dir(const char* tag) {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("docflow_test_" + std::string(tag) + "_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::create_directories(p);
    return p;
}

static void test_metadata_order_and_values() {
    docflow::Metadata m;
    m.add("b", "1");
    m.add("a", "x");
    m.add("b", "2");
    m.set("c", std::vector<std::string>{"p", "q"});

    assert(m.size() == 3);
    assert((m.fields() == std::vector<std::string>{"b", "a", "c"}));
    assert((m.get_all("b") == std::vector<std::string>{"1", "2"}));
    assert(m.get("b") == "1");
    assert(m.get("missing").empty());
    assert(m.get_all("missing").empty());

    m.set("b", "3");
    assert((m.get_all("b") == std::vector<std::string>{"3"}));
    assert(m.fields().front() == "b");

    assert(m.remove("a"));
    assert(!m.remove("a"));
    assert(!m.has("a"));

    // case sensitive by default
    assert(!m.has("B"));

    docflow::Metadata other;
    other.set("c", "replaced");
    other.set("d", "new");
    m.load_from(other);
    assert(m.get("c") == "replaced");
    assert(m.get("d") == "new");

    m.clear();
    assert(m.empty());
}

static void test_metadata_case_insensitive() {
    docflow::Metadata m(false);
    m.add("Content-Type", "text/plain");
    m.add("content-type", "text/html");
    assert(m.size() == 1);
    assert(m.get_all("CONTENT-TYPE").size() == 2);
    assert(m.fields().front() == "Content-Type");
}

static void test_docinfo_equality() {
    docflow::DocInfo a("x.pdf");
    docflow::DocInfo b("x.pdf");
    assert(a == b);
    assert(a.is_root());

    b.embedded_parent_references.push_back("root.zip");
    assert(a != b);
    assert(!b.is_root());

    std::ostringstream os;
    os << b;
    assert(os.str().find("x.pdf") != std::string::npos);
}

static void test_doc_replaces_and_disposes_content() {
    auto dir = mk_tmp_dir("doc");
    docflow::StreamConfig cfg;
    cfg.temp_dir = dir;
    cfg.memory_threshold = 4;
    docflow::StreamFactory f(cfg);

    docflow::Doc doc(docflow::DocInfo("a.txt"), f.from_bytes("spilled content"));
    assert(doc.content().spilled());
    const auto old_file = doc.content().spill_path();
    assert(std::filesystem::exists(old_file));

    doc.set_content(f.from_bytes("new"));
    assert(!std::filesystem::exists(old_file));
    assert(doc.content().read_all() == "new");

    bool threw = false;
    try {
        docflow::Doc bad(docflow::DocInfo("b.txt"), nullptr);
    } catch (const docflow::ImporterException& e) {
        threw = (e.code() == docflow::ErrorCode::InvalidArgs);
    }
    assert(threw);
}

static void test_response_tree_links() {
    docflow::StreamFactory f;
    auto root = std::make_unique<docflow::ImporterResponse>(
        std::make_unique<docflow::Doc>(docflow::DocInfo("root"), f.from_bytes("r")));
    assert(root->is_success());
    assert(root->document() != nullptr);
    assert(root->parent_response() == nullptr);

    auto& child = root->add_nested_response(std::make_unique<docflow::ImporterResponse>(
        "root!a", docflow::ImporterStatus::rejected(nullptr, "nope")));
    assert(child.parent_response() == root.get());
    assert(child.depth() == 1);
    assert(!child.is_success());
    assert(child.document() == nullptr);
    assert(child.status().description() == "nope");
    assert(root->tree_size() == 2);

    auto j = docflow::to_json(*root);
    assert(j["reference"] == "root");
    assert(j["status"]["status"] == "SUCCESS");
    assert(j["nested_responses"].size() == 1);
    assert(j["nested_responses"][0]["status"]["status"] == "REJECTED");

    auto detached = root->remove_nested_response("root!a");
    assert(detached);
    assert(detached->parent_response() == nullptr);
    assert(root->nested_responses().empty());
    assert(!root->remove_nested_response("root!a"));
}

int main() {
    test_metadata_order_and_values();
    test_metadata_case_insensitive();
    test_docinfo_equality();
    test_doc_replaces_and_disposes_content();
    test_response_tree_links();

    std::cout << "OK\n";
    return 0;
}
