#include <algorithm>
#include <stdexcept>
#include <string>

#include "chunking.hpp"
#include "../include/aggregation_error.hpp"

WorkDistributor::WorkDistributor(uint64_t file_size, uint64_t chunk_size,
                                 uint64_t first_chunk, uint64_t stride)
    : file_size_(file_size),
      chunk_size_(chunk_size),
      step_(chunk_size * stride),
      cursor_(first_chunk * chunk_size)
{
    if (chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
    if (stride == 0) throw std::invalid_argument("stride must be positive");
}

std::optional<uint64_t> WorkDistributor::next_chunk_start() {
    if (abandoned_.load(std::memory_order_relaxed))
        return std::nullopt;

    uint64_t start = cursor_.fetch_add(step_, std::memory_order_relaxed);
    if (start >= file_size_)
        return std::nullopt;
    return start;
}

void WorkDistributor::abandon() {
    abandoned_.store(true, std::memory_order_relaxed);
}

ChunkLocator::ChunkLocator(const InputFile& file, uint64_t chunk_size, uint64_t lookback_margin)
    : file_(file), chunk_size_(chunk_size), lookback_margin_(lookback_margin)
{
    if (chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
}

AlignedChunk ChunkLocator::align(uint64_t nominal_start, std::vector<char>& buffer) const {
    return align(nominal_start, chunk_size_, buffer);
}

AlignedChunk ChunkLocator::align(uint64_t nominal_start, uint64_t nominal_size,
                                 std::vector<char>& buffer) const
{
    const uint64_t file_size = file_.size();

    // Over-eager claim near the end of the file: nothing left for this worker
    if (nominal_start >= file_size)
        return {nominal_start, std::string_view()};

    // Read the margin in front of the nominal start as well, clamped to the file
    const uint64_t read_from = nominal_start > lookback_margin_ ? nominal_start - lookback_margin_ : 0;
    const uint64_t lookback = nominal_start - read_from;
    const uint64_t read_len = std::min(nominal_size + lookback, file_size - read_from);
    const bool reaches_eof = read_from + read_len == file_size;

    if (buffer.size() < read_len)
        buffer.resize(read_len);
    file_.read_at(read_from, buffer.data(), read_len);

    // Head: step back from the nominal start to just after the previous terminator.
    // Offset 0 is always a record boundary.
    size_t head = static_cast<size_t>(lookback);
    if (nominal_start != 0) {
        while (head > 0 && buffer[head - 1] != RECORD_TERMINATOR)
            --head;
        if (head == 0 && read_from != 0) {
            throw AlignmentError("no record terminator within " + std::to_string(lookback_margin_) +
                                 " bytes before nominal chunk start; lookback margin is smaller than a record",
                                 nominal_start);
        }
    }

    // Tail: the last terminator in the buffer, inclusive. A chunk that reaches the end
    // of the file keeps everything, including a final record without terminator.
    size_t tail = static_cast<size_t>(read_len);
    if (!reaches_eof) {
        while (tail > head && buffer[tail - 1] != RECORD_TERMINATOR)
            --tail;
        if (tail == head) {
            throw AlignmentError("no record terminator between offsets " + std::to_string(read_from + head) +
                                 " and " + std::to_string(read_from + read_len) +
                                 "; record is longer than the chunk size",
                                 read_from + head);
        }
    }

    return {read_from + head, std::string_view(buffer.data() + head, tail - head)};
}
