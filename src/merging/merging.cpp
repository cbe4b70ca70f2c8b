#include "merging.hpp"
#include "../include/aggregation_error.hpp"
#include "../parsing/record_parser.hpp"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace {

// Printable rendering of raw key bytes for diagnostics
std::string escape_bytes(std::string_view bytes) {
    std::string out;
    for (unsigned char c : bytes) {
        if (c >= 0x20 && c < 0x7F) {
            out += static_cast<char>(c);
        } else {
            char hex[5];
            std::snprintf(hex, sizeof(hex), "\\x%02X", c);
            out += hex;
        }
    }
    return out;
}

template <typename T>
void append_raw(std::vector<char>& buffer, const T& value) {
    const char* p = reinterpret_cast<const char*>(&value);
    buffer.insert(buffer.end(), p, p + sizeof(T));
}

template <typename T>
T read_raw(const char* data, size_t size, size_t& pos) {
    if (pos + sizeof(T) > size) {
        throw std::runtime_error("truncated result buffer");
    }
    T value;
    std::memcpy(&value, data + pos, sizeof(T));
    pos += sizeof(T);
    return value;
}

} // namespace

void LocalAggregator::observe(std::string_view key, double value) {
    auto it = map_.find(key);
    if (it != map_.end()) {
        it->second.update(value);
        return;
    }

    // First time this key is seen by this worker: keep our own copy of the bytes
    const std::string& owned = key_storage_.emplace_back(key);
    map_.emplace(std::string_view(owned), Statistics(value));
}

void GlobalMerger::merge_in(const LocalAggregator& local) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [key, stats] : local.entries()) {
        if (!is_valid_utf8(key)) {
            throw FormatError("key is not valid UTF-8: " + escape_bytes(key));
        }
        auto [it, inserted] = map_.try_emplace(std::string(key), stats);
        if (!inserted) {
            it->second.merge(stats);
        }
    }
}

void GlobalMerger::merge_in(GlobalMap&& partial) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Move whole nodes across; no key is copied
    while (!partial.empty()) {
        auto node = partial.extract(partial.begin());
        auto existing = map_.find(node.key());
        if (existing != map_.end()) {
            existing->second.merge(node.mapped());
        } else {
            map_.insert(std::move(node));
        }
    }
}

GlobalMap GlobalMerger::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    GlobalMap result = std::move(map_);
    map_.clear();
    return result;
}

size_t GlobalMerger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
}

std::vector<char> serialize_results(const GlobalMap& results) {
    std::vector<char> buffer;
    append_raw<uint64_t>(buffer, results.size());
    for (const auto& [key, stats] : results) {
        append_raw<uint32_t>(buffer, static_cast<uint32_t>(key.size()));
        buffer.insert(buffer.end(), key.begin(), key.end());
        append_raw(buffer, stats.sum);
        append_raw(buffer, stats.count);
        append_raw(buffer, stats.min);
        append_raw(buffer, stats.max);
    }
    return buffer;
}

GlobalMap deserialize_results(const char* data, size_t size) {
    GlobalMap results;
    if (size == 0) return results;

    size_t pos = 0;
    uint64_t entries = read_raw<uint64_t>(data, size, pos);
    results.reserve(entries);
    for (uint64_t i = 0; i < entries; ++i) {
        uint32_t key_len = read_raw<uint32_t>(data, size, pos);
        if (pos + key_len > size) {
            throw std::runtime_error("truncated result buffer");
        }
        std::string key(data + pos, key_len);
        pos += key_len;

        Statistics stats;
        stats.sum = read_raw<double>(data, size, pos);
        stats.count = read_raw<double>(data, size, pos);
        stats.min = read_raw<double>(data, size, pos);
        stats.max = read_raw<double>(data, size, pos);
        results.emplace(std::move(key), stats);
    }
    return results;
}
