#include "include/chunk_aggregate.hpp"
#include "parsing/record_parser.hpp"

size_t aggregate_chunk(const ChunkLocator& locator, uint64_t nominal_start,
                       std::vector<char>& buffer, LocalAggregator& local) {
    AlignedChunk chunk = locator.align(nominal_start, buffer);

    RecordParser parser(chunk.data, chunk.file_offset);
    Record record;
    size_t records = 0;
    while (parser.next(record)) {
        local.observe(record.key, record.value);
        ++records;
    }
    return records;
}

size_t aggregate_until_exhausted(WorkDistributor& distributor, const ChunkLocator& locator,
                                 std::vector<char>& buffer, LocalAggregator& local) {
    size_t records = 0;
    try {
        while (auto nominal_start = distributor.next_chunk_start()) {
            records += aggregate_chunk(locator, *nominal_start, buffer, local);
        }
    } catch (...) {
        distributor.abandon();
        throw;
    }
    return records;
}
