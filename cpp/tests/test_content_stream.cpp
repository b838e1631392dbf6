#include <cassert>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>

#include "docflow/content_stream.h"
#include "docflow/errors.h"

static std::filesystem::path mk_tmp_dir(const char* tag) {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("docflow_test_" + std::string(tag) + "_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::create_directories(p);
    return p;
}

static docflow::StreamConfig small_config(const std::filesystem::path& dir) {
    docflow::StreamConfig cfg;
    cfg.temp_dir = dir;
    cfg.memory_threshold = 16;
    return cfg;
}

static void test_memory_stream_rewind() {
    auto dir = mk_tmp_dir("stream_mem");
    docflow::StreamFactory f(small_config(dir));

    auto s = f.from_bytes("0123456789");
    assert(!s->spilled());
    assert(s->size() == 10);

    char buf[4];
    assert(s->read(buf, 4) == 4);
    assert(std::string(buf, 4) == "0123");
    assert(s->position() == 4);

    // rewinding twice is the same as once
    s->rewind();
    s->rewind();
    assert(s->position() == 0);
    assert(s->read(buf, 4) == 4);
    assert(std::string(buf, 4) == "0123");

    assert(s->read_all() == "0123456789");
    assert(s->read_all() == "0123456789");
    assert(s->position() == 0);
}

static void test_spill_to_disk() {
    auto dir = mk_tmp_dir("stream_spill");
    docflow::StreamFactory f(small_config(dir));

    std::string big;
    for (int i = 0; i < 100; ++i) big.push_back((char)('a' + i % 26));

    auto s = f.from_bytes(big);
    assert(s->spilled());
    assert(s->size() == big.size());
    assert(std::filesystem::exists(s->spill_path()));
    assert(f.spill_files_created() == 1);

    // nothing is truncated across the memory/file boundary
    assert(s->read_all() == big);

    std::string got;
    char buf[7];
    size_t n = 0;
    while ((n = s->read(buf, sizeof(buf))) > 0) got.append(buf, n);
    assert(got == big);

    const auto spill = s->spill_path();
    s->dispose();
    s->dispose();
    assert(s->disposed());
    assert(!std::filesystem::exists(spill));

    bool threw = false;
    try {
        s->rewind();
    } catch (const docflow::StreamException& e) {
        threw = (e.code() == docflow::ErrorCode::IoError);
    }
    assert(threw);
}

static void test_writer() {
    auto dir = mk_tmp_dir("stream_writer");
    docflow::StreamFactory f(small_config(dir));

    auto w = f.new_writer();
    assert(w->empty());

    w->write("hello ");
    w->write(std::string(40, 'x'));
    assert(!w->empty());
    assert(w->spilled());
    assert(w->size() == 46);

    auto s = w->to_stream();
    assert(s->size() == 46);
    assert(s->read_all() == "hello " + std::string(40, 'x'));

    bool threw = false;
    try {
        w->write("late");
    } catch (const docflow::StreamException&) {
        threw = true;
    }
    assert(threw);

    // an abandoned writer leaves no file behind
    {
        auto w2 = f.new_writer();
        w2->write(std::string(64, 'y'));
        assert(w2->spilled());
    }
    s.reset();
    assert(std::filesystem::is_empty(f.temp_namespace()));
}

static void test_open_istream_and_namespace_cleanup() {
    auto dir = mk_tmp_dir("stream_ns");
    std::filesystem::path ns;
    {
        docflow::StreamFactory f(small_config(dir));
        std::istringstream in(std::string(50, 'z'));
        auto s = f.open(in);
        assert(s->size() == 50);
        assert(s->spilled());
        ns = f.temp_namespace();
        assert(ns.parent_path() == dir);
        assert(ns.filename().string().rfind("docflow_", 0) == 0);

        auto e = f.empty_stream();
        assert(e->empty());
        assert(e->read_all().empty());
    }
    assert(!std::filesystem::exists(ns));
}

static void test_stream_outliving_factory_removes_namespace() {
    auto dir = mk_tmp_dir("stream_outlive");
    std::unique_ptr<docflow::ContentStream> s;
    std::filesystem::path ns;
    {
        docflow::StreamFactory f(small_config(dir));
        s = f.from_bytes(std::string(100, 'q'));
        assert(s->spilled());
        ns = f.temp_namespace();
    }
    // the factory is gone, the stream still reads its spill file
    assert(std::filesystem::exists(ns));
    assert(s->read_all() == std::string(100, 'q'));

    s.reset();
    assert(!std::filesystem::exists(ns));
}

int main() {
    test_memory_stream_rewind();
    test_spill_to_disk();
    test_writer();
    test_open_istream_and_namespace_cleanup();
    test_stream_outliving_factory_removes_namespace();

    std::cout << "OK\n";
    return 0;
}
