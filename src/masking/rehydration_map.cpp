#include "masking/rehydration_map.hpp"
#include "masking/placeholder.hpp"

#include <openssl/crypto.h>

#include <algorithm>

namespace piiguard {

void secure_wipe(std::string& s) noexcept {
    if (!s.empty()) {
        OPENSSL_cleanse(s.data(), s.size());
    }
    s.clear();
}

RehydrationMap::~RehydrationMap() {
    clear();
}

RehydrationMap::RehydrationMap(RehydrationMap&& other) noexcept
    : entries_(std::move(other.entries_)) {
    other.entries_.clear();
}

RehydrationMap& RehydrationMap::operator=(RehydrationMap&& other) noexcept {
    if (this != &other) {
        clear();
        entries_ = std::move(other.entries_);
        other.entries_.clear();
    }
    return *this;
}

bool RehydrationMap::insert(std::string token, std::string original) {
    if (find(token) != nullptr) {
        secure_wipe(original);
        return false;
    }
    entries_.emplace_back(std::move(token), std::move(original));
    return true;
}

const std::string* RehydrationMap::find(std::string_view token) const {
    const auto it = std::find_if(entries_.begin(), entries_.end(),
        [token](const Entry& e) { return e.first == token; });
    return it == entries_.end() ? nullptr : &it->second;
}

std::string RehydrationMap::rehydrate(std::string_view text) const {
    if (entries_.empty()) {
        return std::string(text);
    }

    std::string result;
    result.reserve(text.size());
    size_t last = 0;
    for (const auto& [start, end] : placeholder::find_all(text)) {
        const auto* original = find(text.substr(start, end - start));
        if (original == nullptr) continue;
        result.append(text.substr(last, start - last));
        result.append(*original);
        last = end;
    }
    result.append(text.substr(last));
    return result;
}

void RehydrationMap::clear() noexcept {
    for (auto& [token, original] : entries_) {
        secure_wipe(original);
        secure_wipe(token);
    }
    std::vector<Entry>().swap(entries_);
}

} // namespace piiguard
