#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace mcpgate {

// Thread-safe map of values that expire at an absolute epoch second.
// An entry is visible only while now < expires_at; a lookup that finds an
// expired entry erases it. There is no size bound and no LRU ordering.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ExpiryCache {
public:
    struct Entry {
        uint64_t expires_at = 0;
        Value value;
    };

    // Insert or overwrite. The last writer wins.
    void put(const Key& key, Value value, uint64_t expires_at) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[key] = Entry{expires_at, std::move(value)};
    }

    // Returns the value if present and live at `now`, evicting it if expired.
    std::optional<Value> get(const Key& key, uint64_t now) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        if (now >= it->second.expires_at) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    // Absolute expiry of a stored entry, live or not.
    std::optional<uint64_t> expires_at(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) return std::nullopt;
        return it->second.expires_at;
    }

    bool remove(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.erase(key) > 0;
    }

    // Drop every entry expired at `now`. Returns the number removed.
    size_t evict_expired(uint64_t now) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t evicted = 0;
        for (auto it = entries_.begin(); it != entries_.end(); ) {
            if (now >= it->second.expires_at) {
                it = entries_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
        return evicted;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Entry, Hash> entries_;
};

} // namespace mcpgate
