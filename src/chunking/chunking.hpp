#ifndef CHUNKING_HPP
#define CHUNKING_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "../include/input_file.hpp"
#include "../include/record.hpp"

constexpr uint64_t DEFAULT_CHUNK_SIZE = 16 * 1024 * 1024; // 16 MB per claim
constexpr uint64_t DEFAULT_LOOKBACK_MARGIN = 64;          // must exceed the longest record

/**
 * Hands out nominal chunk start offsets to any number of worker threads.
 *
 * One atomic cursor over the file's byte length; every claim adds the stride
 * (chunk_size * stride) and returns the value before the increment. With a
 * stride > 1 the distributor only covers one stripe of the chunk grid
 * (chunk indices first_chunk, first_chunk + stride, ...), which is how MPI
 * ranks share the file.
 */
class WorkDistributor {
public:
    WorkDistributor(uint64_t file_size, uint64_t chunk_size,
                    uint64_t first_chunk = 0, uint64_t stride = 1);

    // Next nominal start offset, or nullopt once the cursor has passed the end of the file.
    std::optional<uint64_t> next_chunk_start();

    // Make every further claim return nullopt. Used when a worker has failed.
    void abandon();

    uint64_t chunk_size() const { return chunk_size_; }
    uint64_t file_size() const { return file_size_; }

private:
    uint64_t file_size_;
    uint64_t chunk_size_;
    uint64_t step_;
    std::atomic<uint64_t> cursor_;
    std::atomic<bool> abandoned_{false};
};

// A record-aligned slice of the file, backed by a worker's read buffer.
struct AlignedChunk {
    uint64_t file_offset;   // offset of data[0] in the file
    std::string_view data;  // whole records only, empty when past the end of the file
};

/**
 * Realigns nominal chunk ranges to record boundaries.
 *
 * A chunk claimed at nominal offset N starts right after the last terminator
 * found before N (searching at most lookback_margin bytes back) and ends on the
 * last terminator before N + chunk_size (or at end of file). Two chunks whose
 * nominal offsets are chunk_size apart therefore meet on the same terminator:
 * no record is lost or read twice.
 */
class ChunkLocator {
public:
    ChunkLocator(const InputFile& file, uint64_t chunk_size,
                 uint64_t lookback_margin = DEFAULT_LOOKBACK_MARGIN);

    /**
     * Read and align the chunk claimed at nominal_start.
     *
     * @param nominal_start Offset returned by WorkDistributor::next_chunk_start().
     * @param buffer Worker-owned read buffer, grown if too small, reused across calls.
     * @return The aligned records; the view stays valid until the buffer is reused.
     * @throws AlignmentError if no terminator is found where one is required.
     * @throws IoError if the read fails.
     */
    AlignedChunk align(uint64_t nominal_start, std::vector<char>& buffer) const;

    // Same, with an explicit nominal size instead of the configured chunk size
    AlignedChunk align(uint64_t nominal_start, uint64_t nominal_size, std::vector<char>& buffer) const;

    // Buffer size that avoids any reallocation in align()
    size_t buffer_size() const { return static_cast<size_t>(chunk_size_ + lookback_margin_); }

    uint64_t chunk_size() const { return chunk_size_; }
    uint64_t lookback_margin() const { return lookback_margin_; }

private:
    const InputFile& file_;
    uint64_t chunk_size_;
    uint64_t lookback_margin_;
};

#endif // CHUNKING_HPP
