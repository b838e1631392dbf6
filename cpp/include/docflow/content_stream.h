// docflow/cpp/include/docflow/content_stream.h
#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace docflow {

struct StreamConfig {
    // empty => std::filesystem::temp_directory_path()
    std::filesystem::path temp_dir;

    // bytes kept in memory per stream/writer before spilling to disk
    uint64_t memory_threshold{1024u * 1024u}; // 1 MiB

    bool operator==(const StreamConfig& o) const {
        return temp_dir == o.temp_dir && memory_threshold == o.memory_threshold;
    }
    bool operator!=(const StreamConfig& o) const { return !(*this == o); }
};

class StreamFactory;

// Private spill directory of one factory. Shared by the factory and every
// stream or writer holding a file in it; the last owner removes it.
class TempNamespace {
public:
    explicit TempNamespace(std::filesystem::path dir) : dir_(std::move(dir)) {}
    ~TempNamespace();

    TempNamespace(const TempNamespace&) = delete;
    TempNamespace& operator=(const TempNamespace&) = delete;

    const std::filesystem::path& dir() const { return dir_; }

private:
    std::filesystem::path dir_;
};

// Re-readable document content: the first memory_threshold bytes live in
// memory, the rest in a temp file owned by this stream.
class ContentStream {
public:
    ~ContentStream();

    ContentStream(const ContentStream&) = delete;
    ContentStream& operator=(const ContentStream&) = delete;

    // returns 0 at end of content
    size_t read(char* buf, size_t n);

    // whole content from position 0; leaves the cursor rewound
    std::string read_all();

    void rewind();
    uint64_t position() const { return pos_; }

    uint64_t size() const { return mem_.size() + file_bytes_; }
    bool empty() const { return size() == 0; }

    bool spilled() const { return !file_.empty(); }
    const std::filesystem::path& spill_path() const { return file_; }

    // frees memory and deletes the temp file; safe to call repeatedly
    void dispose();
    bool disposed() const { return disposed_; }

private:
    friend class ContentWriter;
    friend class StreamFactory;

    ContentStream(std::string mem, std::filesystem::path file, uint64_t file_bytes,
                  std::shared_ptr<TempNamespace> ns);

    std::string mem_;
    std::filesystem::path file_;
    std::shared_ptr<TempNamespace> ns_;
    uint64_t file_bytes_{0};
    uint64_t pos_{0};
    std::ifstream in_;
    bool disposed_{false};
};

// Write side with the same spill policy. Whatever was written is handed over
// with to_stream(); an unconsumed writer deletes its temp file.
class ContentWriter {
public:
    ~ContentWriter();

    ContentWriter(const ContentWriter&) = delete;
    ContentWriter& operator=(const ContentWriter&) = delete;

    void write(const char* data, size_t n);
    void write(std::string_view s) { write(s.data(), s.size()); }

    uint64_t size() const { return mem_.size() + file_bytes_; }
    bool empty() const { return size() == 0; }
    bool spilled() const { return !file_.empty(); }

    std::unique_ptr<ContentStream> to_stream();

private:
    friend class StreamFactory;

    explicit ContentWriter(StreamFactory* factory);
    void spill(const char* data, size_t n);

    StreamFactory* factory_{nullptr};
    uint64_t threshold_{0};
    std::string mem_;
    std::filesystem::path file_;
    std::shared_ptr<TempNamespace> ns_;
    std::ofstream out_;
    uint64_t file_bytes_{0};
    bool closed_{false};
};

// One per importer. Spill files go to a private directory under
// StreamConfig::temp_dir, created on first spill and removed when neither
// the factory nor any spilled stream is left.
class StreamFactory {
public:
    explicit StreamFactory(StreamConfig cfg = {});
    ~StreamFactory();

    StreamFactory(const StreamFactory&) = delete;
    StreamFactory& operator=(const StreamFactory&) = delete;

    const StreamConfig& config() const { return cfg_; }

    std::unique_ptr<ContentStream> open(std::istream& in);
    std::unique_ptr<ContentStream> open_file(const std::filesystem::path& p);
    std::unique_ptr<ContentStream> from_bytes(std::string_view bytes);
    std::unique_ptr<ContentStream> empty_stream();

    std::unique_ptr<ContentWriter> new_writer();

    const std::filesystem::path& temp_namespace();
    uint64_t spill_files_created() const { return counter_.load(); }

private:
    friend class ContentWriter;

    std::shared_ptr<TempNamespace> spill_namespace();
    std::filesystem::path new_spill_path(const TempNamespace& ns);

    StreamConfig cfg_;
    std::shared_ptr<TempNamespace> ns_;
    std::mutex ns_mu_;
    std::atomic<uint64_t> counter_{0};
};

} // namespace docflow
