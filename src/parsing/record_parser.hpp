#ifndef RECORD_PARSER_HPP
#define RECORD_PARSER_HPP

#include <cstdint>
#include <string_view>

#include "../include/record.hpp"

/**
 * Forward-only cursor over the records of an aligned chunk.
 *
 * Splits on the record terminator, skips empty lines and splits each line at
 * the first separator. Not restartable: every record is produced once.
 */
class RecordParser {
public:
    RecordParser(std::string_view chunk, uint64_t file_offset);

    // Fill `out` with the next record. Returns false once the chunk is exhausted.
    // Throws FormatError on a malformed record.
    bool next(Record& out);

private:
    std::string_view remaining_;
    uint64_t offset_; // file offset of remaining_[0]
};

// Split one line (without terminator) into key and value
Record parse_record(std::string_view line, uint64_t offset);

// Decode a decimal literal: optional sign, digits, optional fractional part.
// The whole text must be consumed.
double parse_value(std::string_view text, uint64_t offset);

bool is_valid_utf8(std::string_view bytes);

#endif // RECORD_PARSER_HPP
