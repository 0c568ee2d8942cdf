#pragma once

#include "nugget/nugget.hpp"
#include <chrono>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nugget {

/**
 * @brief Bounded, time-limited cache of provider responses
 *
 * Keys are hashes of the normalized content, the prompt and the selected
 * types. Entries expire after the TTL and the oldest insertion is evicted
 * once capacity is exceeded. All members are guarded by one mutex, so a
 * single instance may be shared by concurrent extractions.
 */
class ResponseCache {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /**
     * @brief Constructor
     *
     * @param capacity Maximum number of entries
     * @param ttl Lifetime of an entry
     * @param clock Time source; steady_clock::now when empty
     */
    explicit ResponseCache(size_t capacity = 10,
                           std::chrono::milliseconds ttl = std::chrono::minutes(5),
                           Clock clock = Clock());

    /**
     * @brief 64-bit FNV-1a key as 16 hex digits
     */
    static std::string make_key(const std::string& content,
                                const std::string& prompt,
                                const std::vector<NuggetType>& types = {});

    /**
     * @brief Cached candidates, or nullopt when missing or expired
     *
     * An expired entry is removed as a side effect.
     */
    std::optional<std::vector<RawCandidate>> get(const std::string& key);

    /**
     * @brief Insert or refresh an entry, evicting the oldest beyond capacity
     */
    void put(const std::string& key, const std::vector<RawCandidate>& candidates);

    /**
     * @brief Drop the entry inserted first
     *
     * @return false when the cache is empty
     */
    bool evict_oldest();

    /**
     * @brief Key that evict_oldest() would remove next
     */
    std::optional<std::string> oldest_key() const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

private:
    struct Entry {
        std::vector<RawCandidate> candidates;
        TimePoint inserted_at;
    };

    mutable std::mutex mutex_;
    size_t capacity_;
    std::chrono::milliseconds ttl_;
    Clock clock_;
    std::unordered_map<std::string, Entry> entries_;
    std::deque<std::string> insertion_order_;

    TimePoint now() const;
    void erase_locked(const std::string& key);
    bool evict_oldest_locked();
};

} // namespace nugget
