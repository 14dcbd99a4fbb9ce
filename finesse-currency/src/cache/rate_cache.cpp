#include "cache/rate_cache.hpp"
#include <utility>

namespace finesse {
namespace currency {

RateCache::RateCache(std::chrono::seconds ttl, size_t max_entries, Clock clock)
    : ttl_(ttl)
    , max_entries_(max_entries)
    , clock_(clock ? std::move(clock) : Clock([] { return std::chrono::steady_clock::now(); }))
    , hits_(0)
    , misses_(0)
    , expirations_(0)
    , evictions_(0)
{
}

std::string RateCache::make_key(const std::string& from, const std::string& to) {
    return from + "-" + to;
}

void RateCache::touch(Entry& entry, const std::string& key) {
    lru_list_.erase(entry.lru_position);
    lru_list_.push_front(key);
    entry.lru_position = lru_list_.begin();
}

void RateCache::erase(std::map<std::string, Entry>::iterator it) {
    lru_list_.erase(it->second.lru_position);
    entries_.erase(it);
}

void RateCache::evict_lru() {
    while (max_entries_ > 0 && entries_.size() > max_entries_ && !lru_list_.empty()) {
        auto it = entries_.find(lru_list_.back());
        if (it == entries_.end()) {
            lru_list_.pop_back();
            continue;
        }
        erase(it);
        evictions_++;
    }
}

bool RateCache::get(const std::string& from, const std::string& to, double& rate) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = make_key(from, to);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return false;
    }

    if (clock_() - it->second.stored_at >= ttl_) {
        erase(it);
        expirations_++;
        misses_++;
        return false;
    }

    rate = it->second.rate;
    touch(it->second, key);
    hits_++;
    return true;
}

void RateCache::put(const std::string& from, const std::string& to, double rate) {
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = make_key(from, to);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.rate = rate;
        it->second.stored_at = clock_();
        touch(it->second, key);
        return;
    }

    lru_list_.push_front(key);
    Entry entry;
    entry.rate = rate;
    entry.stored_at = clock_();
    entry.lru_position = lru_list_.begin();
    entries_[key] = entry;

    evict_lru();
}

RateCacheStats RateCache::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    RateCacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.expirations = expirations_;
    stats.evictions = evictions_;
    stats.entries_count = entries_.size();
    return stats;
}

void RateCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.clear();
    lru_list_.clear();
}

} // namespace currency
} // namespace finesse
