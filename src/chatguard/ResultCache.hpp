#pragma once

#include "ModerationResult.hpp"

#include <boost/optional.hpp>

#include <cstddef>
#include <list>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Bounded LRU map from content hash to verdict. Advisory only: a miss just
// means the item gets scored again.
class ResultCache {
public:
    explicit ResultCache(std::size_t capacity);

    // A hit moves the entry to the most recently used position.
    boost::optional<ModerationResult> Get(const std::string& key);

    // Evicts the least recently used entry first when the cache is full.
    void Put(const std::string& key, const ModerationResult& value);

    void Clear();
    std::size_t Size() const;
    std::size_t Capacity() const { return capacity_; }

private:
    using Entry = std::pair<std::string, ModerationResult>;

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
};
