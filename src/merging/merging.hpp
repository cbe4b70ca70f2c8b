#ifndef MERGING_HPP
#define MERGING_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "../include/statistics.hpp"

/**
 * Per-worker key -> statistics map. Never shared, never locked.
 *
 * Lookups use the key view straight out of the chunk buffer. The read buffer
 * is reused for the next chunk, so a key is copied into key_storage_ the first
 * time it is seen and the map is keyed on that copy.
 */
class LocalAggregator {
public:
    using Map = std::unordered_map<std::string_view, Statistics>;

    LocalAggregator() = default;

    // Map keys view into key_storage_; a move keeps those strings in place, a copy would not
    LocalAggregator(const LocalAggregator&) = delete;
    LocalAggregator& operator=(const LocalAggregator&) = delete;
    LocalAggregator(LocalAggregator&&) = default;
    LocalAggregator& operator=(LocalAggregator&&) = default;

    void observe(std::string_view key, double value);

    const Map& entries() const { return map_; }
    size_t size() const { return map_.size(); }
    bool empty() const { return map_.empty(); }

private:
    std::deque<std::string> key_storage_; // deque: element addresses survive emplace_back
    Map map_;
};

/**
 * Shared key -> statistics map every worker merges into once, at the end of its run.
 * The lock is held for one whole merge_in() call and never between calls.
 */
class GlobalMerger {
public:
    // Fold a worker's local map in. Keys are checked for UTF-8 and copied out.
    void merge_in(const LocalAggregator& local);

    // Fold an already owned map in (results received from another process)
    void merge_in(GlobalMap&& partial);

    // Hand the final map to the reporting stage; leaves the merger empty
    GlobalMap take();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    GlobalMap map_;
};

/**
 * Flatten a result map into a byte buffer and back.
 *
 * Layout: uint64 entry count, then per entry uint32 key length, key bytes,
 * and sum, count, min, max as four doubles (host byte order).
 */
std::vector<char> serialize_results(const GlobalMap& results);
GlobalMap deserialize_results(const char* data, size_t size);

#endif // MERGING_HPP
