#pragma once

#include <mutex>
#include <string>
#include <unordered_set>

namespace ts::sync {

// Digests already stored somewhere in the workspace. Every membership check and insert
// goes through one lock so two downloads with the same bytes cannot both pass.
class HashSet {
public:
    HashSet() = default;
    explicit HashSet(std::unordered_set<std::string> seed) : hashes_(std::move(seed)) {}

    [[nodiscard]] bool contains(const std::string& hash) const;
    void insert(const std::string& hash);

    // Insert-if-absent. False means the digest was already known.
    [[nodiscard]] bool tryClaim(const std::string& hash);

    void release(const std::string& hash);

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_set<std::string> hashes_;
};

}
