// docflow/cpp/src/metadata.cpp
#include "docflow/metadata.h"
#include "text_common.h"

#include <algorithm>

namespace docflow {

bool Metadata::same_field(const std::string& a, const std::string& b) const {
    return case_sensitive_ ? a == b : iequals_ascii(a, b);
}

Metadata::Entry* Metadata::find(const std::string& field) {
    for (auto& e : entries_) {
        if (same_field(e.first, field)) return &e;
    }
    return nullptr;
}

const Metadata::Entry* Metadata::find(const std::string& field) const {
    for (const auto& e : entries_) {
        if (same_field(e.first, field)) return &e;
    }
    return nullptr;
}

void Metadata::add(const std::string& field, const std::string& value) {
    if (Entry* e = find(field)) {
        e->second.push_back(value);
        return;
    }
    entries_.emplace_back(field, std::vector<std::string>{value});
}

void Metadata::add(const std::string& field, const std::vector<std::string>& values) {
    if (Entry* e = find(field)) {
        e->second.insert(e->second.end(), values.begin(), values.end());
        return;
    }
    entries_.emplace_back(field, values);
}

void Metadata::set(const std::string& field, const std::string& value) {
    set(field, std::vector<std::string>{value});
}

void Metadata::set(const std::string& field, const std::vector<std::string>& values) {
    if (Entry* e = find(field)) {
        e->second = values;
        return;
    }
    entries_.emplace_back(field, values);
}

std::string Metadata::get(const std::string& field) const {
    const Entry* e = find(field);
    if (!e || e->second.empty()) return std::string();
    return e->second.front();
}

std::vector<std::string> Metadata::get_all(const std::string& field) const {
    const Entry* e = find(field);
    return e ? e->second : std::vector<std::string>{};
}

bool Metadata::has(const std::string& field) const {
    return find(field) != nullptr;
}

bool Metadata::remove(const std::string& field) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return same_field(e.first, field); });
    if (it == entries_.end()) return false;
    entries_.erase(it);
    return true;
}

void Metadata::load_from(const Metadata& other) {
    for (const auto& e : other.entries_) set(e.first, e.second);
}

std::vector<std::string> Metadata::fields() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) out.push_back(e.first);
    return out;
}

bool Metadata::operator==(const Metadata& o) const {
    return case_sensitive_ == o.case_sensitive_ && entries_ == o.entries_;
}

} // namespace docflow
