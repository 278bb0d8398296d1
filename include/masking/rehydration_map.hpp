#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace piiguard {

/**
 * @brief Zero a string's bytes, then empty it
 */
void secure_wipe(std::string& s) noexcept;

/**
 * @brief Per-request placeholder token -> original text mapping
 *
 * Move-only. clear() zeroes every stored byte before releasing it and runs
 * on destruction; a moved-from map is empty. Never serialize one into a log
 * record or anything that outlives the request.
 */
class RehydrationMap {
public:
    using Entry = std::pair<std::string, std::string>;   // token, original

    RehydrationMap() = default;
    ~RehydrationMap();

    RehydrationMap(const RehydrationMap&) = delete;
    RehydrationMap& operator=(const RehydrationMap&) = delete;

    RehydrationMap(RehydrationMap&& other) noexcept;
    RehydrationMap& operator=(RehydrationMap&& other) noexcept;

    /**
     * @return false if the token is already mapped (existing value kept)
     */
    bool insert(std::string token, std::string original);

    /**
     * @return Original text for token, nullptr if unmapped
     */
    [[nodiscard]] const std::string* find(std::string_view token) const;

    [[nodiscard]] size_t size() const { return entries_.size(); }
    [[nodiscard]] bool empty() const { return entries_.empty(); }

    /**
     * @brief Insertion-ordered entries (response building only)
     */
    [[nodiscard]] const std::vector<Entry>& entries() const { return entries_; }

    /**
     * @brief Replace every mapped token in text with its original
     *
     * Tokens without a mapping are left as-is.
     */
    [[nodiscard]] std::string rehydrate(std::string_view text) const;

    /**
     * @brief Zero all stored bytes and drop every entry
     */
    void clear() noexcept;

private:
    std::vector<Entry> entries_;
};

} // namespace piiguard
