// docflow/cpp/src/zip_splitter.cpp
#include "docflow/splitters.h"
#include "docflow/errors.h"
#include "docflow/log.h"

#include <zip.h>

#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace docflow {

namespace {

bool looks_like_zip(const std::string& bytes) {
    if (bytes.size() < 4) return false;
    return std::memcmp(bytes.data(), "PK\x03\x04", 4) == 0 ||
           std::memcmp(bytes.data(), "PK\x05\x06", 4) == 0;
}

// no absolute paths, backslashes or ".." segments
bool zip_entry_name_is_safe(const std::string& name) {
    if (name.empty()) return false;
    if (name.find('\0') != std::string::npos) return false;
    if (name[0] == '/') return false;
    if (name.find('\\') != std::string::npos) return false;

    fs::path rel = fs::path(name).lexically_normal();
    if (rel.empty()) return false;
    if (rel.is_absolute()) return false;

    for (const auto& part : rel) {
        if (part.string() == "..") return false;
    }
    return true;
}

} // namespace

std::vector<std::unique_ptr<Doc>> ZipSplitter::split(HandlerDoc& doc, ContentStream& in,
                                                     ContentWriter&, ParseState) {
    std::vector<std::unique_ptr<Doc>> children;

    // libzip reads from this buffer until the archive is closed
    const std::string bytes = in.read_all();
    if (!looks_like_zip(bytes)) return children;

    zip_error_t zerr;
    zip_error_init(&zerr);
    zip_source_t* src = zip_source_buffer_create(bytes.data(), bytes.size(), 0, &zerr);
    if (!src) {
        const std::string msg = zip_error_strerror(&zerr);
        zip_error_fini(&zerr);
        throw std::runtime_error("zip_source_buffer_create failed: " + msg);
    }
    zip_t* za = zip_open_from_source(src, ZIP_RDONLY, &zerr);
    if (!za) {
        const std::string msg = zip_error_strerror(&zerr);
        zip_source_free(src);
        zip_error_fini(&zerr);
        throw std::runtime_error("zip_open failed for " + doc.reference() + ": " + msg);
    }
    zip_error_fini(&zerr);
    auto za_guard = std::unique_ptr<zip_t, decltype(&zip_discard)>(za, &zip_discard);

    const zip_int64_t n = zip_get_num_entries(za, 0);
    if (n < 0) throw std::runtime_error("zip_get_num_entries failed");
    if ((size_t)n > opt_.max_entries) {
        throw std::runtime_error("zip too many entries: " + std::to_string((size_t)n));
    }

    uint64_t total = 0;
    std::string buf(1 << 16, '\0');

    for (zip_uint64_t i = 0; i < (zip_uint64_t)n; ++i) {
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(za, i, 0, &st) != 0) continue;

        const std::string name = st.name ? st.name : "";
        if (name.empty() || name.back() == '/') continue; // directory entry

        if (!zip_entry_name_is_safe(name)) {
            log_warn("skipping unsafe zip entry \"" + name + "\" in " + doc.reference());
            continue;
        }

        total += (uint64_t)st.size;
        if (total > opt_.max_total_uncompressed_bytes) {
            throw std::runtime_error("zip exceeds max_total_uncompressed_bytes: " + doc.reference());
        }

        zip_file_t* zf = zip_fopen_index(za, i, 0);
        if (!zf) {
            throw std::runtime_error("zip_fopen_index failed for entry: " + name + " (" +
                                     std::string(zip_strerror(za)) + ")");
        }
        auto zf_guard = std::unique_ptr<zip_file_t, decltype(&zip_fclose)>(zf, &zip_fclose);

        auto w = doc.streams().new_writer();
        while (true) {
            const zip_int64_t rd = zip_fread(zf, &buf[0], buf.size());
            if (rd < 0) throw std::runtime_error("zip_fread failed for entry: " + name);
            if (rd == 0) break;
            w->write(buf.data(), (size_t)rd);
        }

        const std::string ref = doc.reference() + "!" + name;
        Metadata meta(doc.metadata().case_sensitive());
        meta.set(fields::REFERENCE, ref);
        meta.set(fields::EMBEDDED_REFERENCE, name);
        meta.set(fields::EMBEDDED_TYPE, "archive-entry");

        children.push_back(std::make_unique<Doc>(DocInfo(ref), w->to_stream(), std::move(meta)));
    }

    return children;
}

} // namespace docflow
