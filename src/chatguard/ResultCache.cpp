#include "ResultCache.hpp"

ResultCache::ResultCache(std::size_t capacity)
    : capacity_{capacity} {}

boost::optional<ModerationResult> ResultCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto iter = index_.find(key);
    if (iter == index_.end()) {
        return boost::none;
    }

    entries_.splice(entries_.begin(), entries_, iter->second);
    return iter->second->second;
}

void ResultCache::Put(const std::string& key, const ModerationResult& value) {
    if (capacity_ == 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto iter = index_.find(key);
    if (iter != index_.end()) {
        iter->second->second = value;
        entries_.splice(entries_.begin(), entries_, iter->second);
        return;
    }

    if (entries_.size() >= capacity_) {
        index_.erase(entries_.back().first);
        entries_.pop_back();
    }

    entries_.emplace_front(key, value);
    index_[key] = entries_.begin();
}

void ResultCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    index_.clear();
    entries_.clear();
}

std::size_t ResultCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}
