#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "../chunking/chunking.hpp"
#include "../merging/merging.hpp"

// Align the chunk claimed at nominal_start, parse it and feed every record to `local`.
// Returns the number of records observed.
size_t aggregate_chunk(const ChunkLocator& locator, uint64_t nominal_start,
                       std::vector<char>& buffer, LocalAggregator& local);

// Worker loop: claim -> align -> parse & aggregate, until the distributor runs dry.
// On failure the distributor is abandoned so the other workers stop claiming.
// Returns the number of records observed.
size_t aggregate_until_exhausted(WorkDistributor& distributor, const ChunkLocator& locator,
                                 std::vector<char>& buffer, LocalAggregator& local);
