#include "sync/HashSet.hpp"

using namespace ts::sync;

bool HashSet::contains(const std::string& hash) const {
    std::scoped_lock lock(mutex_);
    return hashes_.contains(hash);
}

void HashSet::insert(const std::string& hash) {
    std::scoped_lock lock(mutex_);
    hashes_.insert(hash);
}

bool HashSet::tryClaim(const std::string& hash) {
    std::scoped_lock lock(mutex_);
    return hashes_.insert(hash).second;
}

void HashSet::release(const std::string& hash) {
    std::scoped_lock lock(mutex_);
    hashes_.erase(hash);
}

size_t HashSet::size() const {
    std::scoped_lock lock(mutex_);
    return hashes_.size();
}
