// docflow/cpp/src/content_type.cpp
#include "docflow/content_type.h"
#include "text_common.h"

#include <cstring>
#include <filesystem>
#include <unordered_map>

namespace docflow {

namespace {

struct Magic {
    const char* bytes;
    size_t len;
    const char* type;
};

const Magic MAGICS[] = {
    {"%PDF-", 5, "application/pdf"},
    {"PK\x03\x04", 4, "application/zip"},
    {"PK\x05\x06", 4, "application/zip"},
    {"\x89PNG\r\n\x1a\n", 8, "image/png"},
    {"\xFF\xD8\xFF", 3, "image/jpeg"},
    {"GIF87a", 6, "image/gif"},
    {"GIF89a", 6, "image/gif"},
    {"\x1F\x8B", 2, "application/gzip"},
    {"{\\rtf", 5, "application/rtf"},
};

const std::unordered_map<std::string, std::string>& extension_map() {
    static const std::unordered_map<std::string, std::string> m = {
        {".txt", "text/plain"},
        {".text", "text/plain"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".htm", "text/html"},
        {".html", "text/html"},
        {".xml", "application/xml"},
        {".json", "application/json"},
        {".jsonl", "application/x-ndjson"},
        {".ndjson", "application/x-ndjson"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ods", "application/vnd.oasis.opendocument.spreadsheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".rtf", "application/rtf"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
    };
    return m;
}

std::string strip_fragment(const std::string& reference) {
    // "a.pdf#page2", "a.zip!b.txt", "http://x/a.pdf?x=1"
    size_t cut = reference.find_first_of("#?");
    return cut == std::string::npos ? reference : reference.substr(0, cut);
}

} // namespace

std::string base_content_type(const std::string& content_type) {
    const size_t semi = content_type.find(';');
    std::string base = semi == std::string::npos ? content_type : content_type.substr(0, semi);
    return to_lower_copy(std::string(trim_view(base)));
}

std::string content_type_from_extension(const std::string& reference) {
    const std::string path = strip_fragment(reference);
    const std::string ext = to_lower_copy(std::filesystem::path(path).extension().string());
    if (ext.empty()) return std::string();
    auto it = extension_map().find(ext);
    return it == extension_map().end() ? std::string() : it->second;
}

std::string DefaultContentTypeDetector::detect(ContentStream& content, const std::string& reference) {
    char head[16] = {0};
    content.rewind();
    const size_t n = content.read(head, sizeof(head));
    content.rewind();

    // archives are named by extension first: docx/xlsx/odt are zip containers
    const std::string by_ext = content_type_from_extension(reference);

    for (const auto& m : MAGICS) {
        if (n < m.len || std::memcmp(head, m.bytes, m.len) != 0) continue;
        if (std::strcmp(m.type, "application/zip") == 0 && !by_ext.empty()) return by_ext;
        return m.type;
    }
    if (!by_ext.empty()) return by_ext;
    if (n == 0) return OCTET_STREAM;

    // printable, valid UTF-8 head => text/plain
    const std::string_view sv(head, n);
    size_t cut = utf8_safe_prefix_len(sv, n);
    bool printable = cut > 0;
    for (size_t i = 0; i < cut && printable; ++i) {
        const unsigned char c = (unsigned char)head[i];
        if (c < 0x20 && c != '\n' && c != '\r' && c != '\t' && c != '\f') printable = false;
    }
    return printable ? "text/plain" : OCTET_STREAM;
}

std::string content_family(const std::string& content_type) {
    const std::string ct = base_content_type(content_type);
    if (ct.empty()) return std::string();
    if (ct == "application/pdf") return "pdf";
    if (ct == "text/html" || ct == "application/xhtml+xml") return "html";
    if (ct == "application/xml" || ct == "text/xml") return "xml";
    if (ct == "application/json" || ct == "application/x-ndjson") return "json";
    if (ct == "text/csv" || ct == "text/tab-separated-values" ||
        ct == "application/vnd.ms-excel" ||
        ct.find("spreadsheet") != std::string::npos) return "spreadsheet";
    if (ct == "application/msword" || ct == "application/rtf" ||
        ct.find("wordprocessing") != std::string::npos ||
        ct.find("opendocument.text") != std::string::npos) return "word_processor";
    if (ct == "application/vnd.ms-powerpoint" || ct.find("presentation") != std::string::npos)
        return "presentation";
    if (ct == "application/zip" || ct == "application/gzip" || ct == "application/x-tar")
        return "archive";
    if (ct.rfind("image/", 0) == 0) return "image";
    if (ct.rfind("text/", 0) == 0) return "text";
    return std::string();
}

} // namespace docflow
