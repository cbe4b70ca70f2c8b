#include "record_parser.hpp"
#include "../include/aggregation_error.hpp"

#include <charconv>
#include <cstdint>
#include <string>
#include <system_error>

RecordParser::RecordParser(std::string_view chunk, uint64_t file_offset)
    : remaining_(chunk), offset_(file_offset) {}

bool RecordParser::next(Record& out) {
    while (!remaining_.empty()) {
        size_t end = remaining_.find(RECORD_TERMINATOR);
        std::string_view line = remaining_.substr(0, end);
        uint64_t line_offset = offset_;

        // Advance past the line and its terminator (if any)
        size_t consumed = (end == std::string_view::npos) ? remaining_.size() : end + 1;
        remaining_.remove_prefix(consumed);
        offset_ += consumed;

        if (line.empty()) continue;

        out = parse_record(line, line_offset);
        return true;
    }
    return false;
}

Record parse_record(std::string_view line, uint64_t offset) {
    size_t split = line.find(FIELD_SEPARATOR);
    if (split == std::string_view::npos) {
        throw FormatError("record has no '" + std::string(1, FIELD_SEPARATOR) + "' separator", offset);
    }
    std::string_view key = line.substr(0, split);
    double value = parse_value(line.substr(split + 1), offset + split + 1);
    return {key, value, offset};
}

double parse_value(std::string_view text, uint64_t offset) {
    if (!is_valid_utf8(text)) {
        throw FormatError("value bytes are not valid UTF-8", offset);
    }

    // from_chars does not take a leading '+'
    std::string_view digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) {
            throw FormatError("invalid number '" + std::string(text) + "'", offset);
        }
    }

    double value = 0.0;
    const char* first = digits.data();
    const char* last = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (digits.empty() || ec != std::errc() || ptr != last) {
        throw FormatError("invalid number '" + std::string(text) + "'", offset);
    }
    return value;
}

bool is_valid_utf8(std::string_view bytes) {
    size_t i = 0;
    const size_t n = bytes.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(bytes[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        size_t extra;
        uint32_t code_point;
        if ((c & 0xE0) == 0xC0) { extra = 1; code_point = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; code_point = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; code_point = c & 0x07; }
        else return false;

        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(bytes[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong encodings, surrogates and values past U+10FFFF
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}
