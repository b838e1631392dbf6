// docflow/cpp/src/content_stream.cpp
#include "docflow/content_stream.h"
#include "docflow/errors.h"
#include "docflow/log.h"

#include <algorithm>
#include <cstring>

#if defined(_WIN32)
#include <process.h>
#define DOCFLOW_GETPID _getpid
#else
#include <unistd.h>
#define DOCFLOW_GETPID ::getpid
#endif

namespace fs = std::filesystem;

namespace docflow {

namespace {

constexpr size_t IO_CHUNK = 1 << 16;

std::atomic<uint64_t> g_factory_seq{0};

void remove_file_quietly(const fs::path& p) {
    if (p.empty()) return;
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) log_warn("cannot delete spill file " + p.string() + ": " + ec.message());
}

} // namespace

// -------------------- TempNamespace --------------------

TempNamespace::~TempNamespace() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) log_warn("cannot delete temp dir " + dir_.string() + ": " + ec.message());
}

// -------------------- ContentStream --------------------

ContentStream::ContentStream(std::string mem, fs::path file, uint64_t file_bytes,
                             std::shared_ptr<TempNamespace> ns)
    : mem_(std::move(mem)), file_(std::move(file)), ns_(std::move(ns)),
      file_bytes_(file_bytes) {}

ContentStream::~ContentStream() {
    dispose();
}

size_t ContentStream::read(char* buf, size_t n) {
    if (disposed_) throw StreamException("read on a disposed content stream");
    size_t done = 0;

    // memory part first
    if (pos_ < mem_.size()) {
        const size_t take = std::min(n, (size_t)(mem_.size() - pos_));
        std::memcpy(buf, mem_.data() + pos_, take);
        pos_ += take;
        done += take;
    }
    if (done == n || file_bytes_ == 0) return done;

    const uint64_t file_pos = pos_ - mem_.size();
    if (file_pos >= file_bytes_) return done;

    if (!in_.is_open()) {
        in_.open(file_, std::ios::binary);
        if (!in_) throw StreamException("cannot open spill file: " + file_.string());
    }
    in_.clear();
    in_.seekg((std::streamoff)file_pos, std::ios::beg);
    if (!in_) throw StreamException("seek failed in spill file: " + file_.string());

    const size_t want = std::min(n - done, (size_t)(file_bytes_ - file_pos));
    in_.read(buf + done, (std::streamsize)want);
    const size_t got = (size_t)in_.gcount();
    if (got != want) throw StreamException("short read in spill file: " + file_.string());
    pos_ += got;
    done += got;
    return done;
}

std::string ContentStream::read_all() {
    rewind();
    std::string out;
    out.reserve((size_t)size());
    out.append(mem_);
    if (file_bytes_ > 0) {
        pos_ = mem_.size();
        std::string buf(IO_CHUNK, '\0');
        while (true) {
            const size_t rd = read(&buf[0], buf.size());
            if (rd == 0) break;
            out.append(buf.data(), rd);
        }
    }
    rewind();
    return out;
}

void ContentStream::rewind() {
    if (disposed_) throw StreamException("rewind on a disposed content stream");
    pos_ = 0;
}

void ContentStream::dispose() {
    if (disposed_) return;
    disposed_ = true;
    if (in_.is_open()) in_.close();
    std::string().swap(mem_);
    remove_file_quietly(file_);
    file_.clear();
    ns_.reset();
    file_bytes_ = 0;
    pos_ = 0;
}

// -------------------- ContentWriter --------------------

ContentWriter::ContentWriter(StreamFactory* factory)
    : factory_(factory), threshold_(factory->config().memory_threshold) {}

ContentWriter::~ContentWriter() {
    if (out_.is_open()) out_.close();
    remove_file_quietly(file_);
}

void ContentWriter::write(const char* data, size_t n) {
    if (closed_) throw StreamException("write on a closed content writer");
    if (n == 0) return;

    if (file_.empty() && mem_.size() < threshold_) {
        const size_t room = (size_t)(threshold_ - mem_.size());
        const size_t take = std::min(room, n);
        mem_.append(data, take);
        data += take;
        n -= take;
        if (n == 0) return;
    }
    spill(data, n);
}

void ContentWriter::spill(const char* data, size_t n) {
    if (file_.empty()) {
        ns_ = factory_->spill_namespace();
        file_ = factory_->new_spill_path(*ns_);
        out_.open(file_, std::ios::binary | std::ios::trunc);
        if (!out_) {
            const std::string p = file_.string();
            file_.clear();
            ns_.reset();
            throw StreamException("cannot create spill file: " + p);
        }
    }
    out_.write(data, (std::streamsize)n);
    if (!out_) throw StreamException("write failed on spill file: " + file_.string());
    file_bytes_ += n;
}

std::unique_ptr<ContentStream> ContentWriter::to_stream() {
    if (closed_) throw StreamException("content writer already consumed");
    closed_ = true;
    if (out_.is_open()) {
        out_.flush();
        if (!out_) throw StreamException("flush failed on spill file: " + file_.string());
        out_.close();
    }
    std::unique_ptr<ContentStream> s(
        new ContentStream(std::move(mem_), std::move(file_), file_bytes_, std::move(ns_)));
    mem_.clear();
    file_.clear();
    file_bytes_ = 0;
    return s;
}

// -------------------- StreamFactory --------------------

StreamFactory::StreamFactory(StreamConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.temp_dir.empty()) cfg_.temp_dir = fs::temp_directory_path();
}

StreamFactory::~StreamFactory() = default;

std::shared_ptr<TempNamespace> StreamFactory::spill_namespace() {
    std::lock_guard<std::mutex> lk(ns_mu_);
    if (!ns_) {
        const uint64_t seq = g_factory_seq.fetch_add(1);
        fs::path p = cfg_.temp_dir /
            ("docflow_" + std::to_string((long long)DOCFLOW_GETPID()) + "_" + std::to_string(seq));
        std::error_code ec;
        fs::create_directories(p, ec);
        if (ec) {
            throw StreamException("cannot create temp dir: " + p.string() + " err=" + ec.message());
        }
        ns_ = std::make_shared<TempNamespace>(std::move(p));
    }
    return ns_;
}

const fs::path& StreamFactory::temp_namespace() {
    return spill_namespace()->dir();
}

fs::path StreamFactory::new_spill_path(const TempNamespace& ns) {
    const uint64_t n = counter_.fetch_add(1);
    return ns.dir() / ("stream_" + std::to_string(n) + ".bin");
}

std::unique_ptr<ContentWriter> StreamFactory::new_writer() {
    return std::unique_ptr<ContentWriter>(new ContentWriter(this));
}

std::unique_ptr<ContentStream> StreamFactory::open(std::istream& in) {
    auto w = new_writer();
    std::string buf(IO_CHUNK, '\0');
    while (in) {
        in.read(&buf[0], (std::streamsize)buf.size());
        const std::streamsize got = in.gcount();
        if (got > 0) w->write(buf.data(), (size_t)got);
    }
    if (in.bad()) throw StreamException("read failed on source stream");
    return w->to_stream();
}

std::unique_ptr<ContentStream> StreamFactory::open_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in) throw StreamException("cannot open file: " + p.string());
    return open(in);
}

std::unique_ptr<ContentStream> StreamFactory::from_bytes(std::string_view bytes) {
    auto w = new_writer();
    w->write(bytes);
    return w->to_stream();
}

std::unique_ptr<ContentStream> StreamFactory::empty_stream() {
    return std::unique_ptr<ContentStream>(
        new ContentStream(std::string(), fs::path(), 0, nullptr));
}

} // namespace docflow
