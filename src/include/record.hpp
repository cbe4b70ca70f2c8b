#pragma once
#include <cstdint>
#include <string_view>

// Input format: one "<key>;<value>\n" line per observation
constexpr char RECORD_TERMINATOR = '\n';
constexpr char FIELD_SEPARATOR = ';';

// the structure of a single parsed Record
struct Record {
    std::string_view key; // points into the chunk buffer, no copy
    double value;
    uint64_t offset;      // file offset of the first byte of the line
    // a Record is only valid until the worker reads its next chunk
};
