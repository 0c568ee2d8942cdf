#include "llm/response_cache.hpp"
#include "text/text_normalize.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>

namespace nugget {

namespace {

constexpr uint64_t kFnvOffsetBasis = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void fnv1a_update(uint64_t& hash, const std::string& data) {
    for (unsigned char c : data) {
        hash ^= c;
        hash *= kFnvPrime;
    }
}

} // anonymous namespace

ResponseCache::ResponseCache(size_t capacity,
                             std::chrono::milliseconds ttl,
                             Clock clock)
    : capacity_(std::max<size_t>(1, capacity)),
      ttl_(ttl),
      clock_(std::move(clock)) {}

ResponseCache::TimePoint ResponseCache::now() const {
    return clock_ ? clock_() : std::chrono::steady_clock::now();
}

std::string ResponseCache::make_key(const std::string& content,
                                    const std::string& prompt,
                                    const std::vector<NuggetType>& types) {
    uint64_t hash = kFnvOffsetBasis;
    fnv1a_update(hash, advanced_normalize(content));
    fnv1a_update(hash, "\n");
    fnv1a_update(hash, prompt);
    for (auto type : types) {
        fnv1a_update(hash, "\n");
        fnv1a_update(hash, nugget_type_to_string(type));
    }

    std::ostringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return ss.str();
}

std::optional<std::vector<RawCandidate>> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }

    if (now() - it->second.inserted_at >= ttl_) {
        erase_locked(key);
        return std::nullopt;
    }

    return it->second.candidates;
}

void ResponseCache::put(const std::string& key, const std::vector<RawCandidate>& candidates) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (entries_.count(key)) {
        erase_locked(key);
    }

    entries_[key] = Entry{candidates, now()};
    insertion_order_.push_back(key);

    while (entries_.size() > capacity_) {
        evict_oldest_locked();
    }
}

bool ResponseCache::evict_oldest() {
    std::lock_guard<std::mutex> lock(mutex_);
    return evict_oldest_locked();
}

std::optional<std::string> ResponseCache::oldest_key() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (insertion_order_.empty()) {
        return std::nullopt;
    }
    return insertion_order_.front();
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    insertion_order_.clear();
}

void ResponseCache::erase_locked(const std::string& key) {
    entries_.erase(key);
    auto pos = std::find(insertion_order_.begin(), insertion_order_.end(), key);
    if (pos != insertion_order_.end()) {
        insertion_order_.erase(pos);
    }
}

bool ResponseCache::evict_oldest_locked() {
    if (insertion_order_.empty()) {
        return false;
    }
    entries_.erase(insertion_order_.front());
    insertion_order_.pop_front();
    return true;
}

} // namespace nugget
