#pragma once

#include <string>
#include <map>
#include <list>
#include <mutex>
#include <chrono>
#include <functional>

namespace finesse {
namespace currency {

/**
 * Rate cache statistics
 */
struct RateCacheStats {
    size_t hits;
    size_t misses;
    size_t expirations;     // Lookups that found only an expired entry
    size_t evictions;       // Entries dropped to honour max_entries
    size_t entries_count;
};

/**
 * In-memory exchange rate cache with time-to-live and LRU eviction
 *
 * Features:
 * - "FROM-TO" keys, one rate per currency pair
 * - Entries older than the TTL are never returned (and are dropped on lookup)
 * - Optional max entry count; the least recently used pair is evicted first
 * - Injectable clock so expiry can be tested without sleeping
 * - Thread-safe: one cache may be shared by several clients
 */
class RateCache {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    static constexpr std::chrono::seconds DEFAULT_TTL{3600};

    /**
     * Constructor
     * @param ttl Time-to-live of a cached rate (default: 1 hour)
     * @param max_entries Maximum number of pairs kept; 0 = unbounded
     * @param clock Time source (default: std::chrono::steady_clock::now)
     */
    explicit RateCache(std::chrono::seconds ttl = DEFAULT_TTL,
                       size_t max_entries = 0,
                       Clock clock = Clock());

    /**
     * Look up a cached rate
     * @param from Source currency code
     * @param to Target currency code
     * @param rate Output rate
     * @return true on a fresh hit, false on a miss or an expired entry
     */
    bool get(const std::string& from, const std::string& to, double& rate);

    /**
     * Store a rate, replacing any previous entry for the pair
     */
    void put(const std::string& from, const std::string& to, double rate);

    /**
     * Cache key of a pair ("USD-EUR")
     */
    static std::string make_key(const std::string& from, const std::string& to);

    RateCacheStats get_stats() const;

    void clear();

    std::chrono::seconds ttl() const { return ttl_; }

private:
    struct Entry {
        double rate;
        std::chrono::steady_clock::time_point stored_at;
        std::list<std::string>::iterator lru_position;
    };

    std::chrono::seconds ttl_;
    size_t max_entries_;
    Clock clock_;
    mutable std::mutex mutex_;

    // Most recently used key at the front
    std::list<std::string> lru_list_;
    std::map<std::string, Entry> entries_;

    size_t hits_;
    size_t misses_;
    size_t expirations_;
    size_t evictions_;

    void touch(Entry& entry, const std::string& key);
    void erase(std::map<std::string, Entry>::iterator it);
    void evict_lru();
};

} // namespace currency
} // namespace finesse
