// docflow/cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// UTF-8 validity with overlong/surrogate/out-of-range checks
bool utf8_is_valid(std::string_view s);

void append_utf8(uint32_t cp, std::string& out);

// Single-byte CP1251 -> UTF-8 (common for legacy RU/KZ .txt files)
std::string cp1251_to_utf8(std::string_view s);

// Longest prefix of at most max_bytes that does not cut a UTF-8 sequence
size_t utf8_safe_prefix_len(std::string_view s, size_t max_bytes);
std::string safe_preview_utf8(const std::string& s, size_t max_bytes);

// ASCII-only case folding (field names, extensions, content types)
std::string to_lower_copy(std::string s);
bool iequals_ascii(std::string_view a, std::string_view b);

std::string_view trim_view(std::string_view s);
bool is_blank(std::string_view s);

// "2026-01-31T12:00:00Z"
std::string utc_now_iso();
