#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// The three ways a run can fail. None of them is recovered from.
enum class ErrorCategory {
    Io,         // file cannot be opened, stat'ed or read
    Alignment,  // no record terminator inside the lookback margin / record longer than a chunk
    Format      // missing separator, non UTF-8 bytes, unparseable number
};

inline const char* category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Io:        return "io";
        case ErrorCategory::Alignment: return "alignment";
        case ErrorCategory::Format:    return "format";
    }
    return "unknown";
}

// Base of every error raised by the aggregation core.
// Carries the failure category and, when known, the byte offset in the input file.
class AggregationError : public std::runtime_error {
public:
    AggregationError(ErrorCategory category, const std::string& message,
                     std::optional<uint64_t> offset = std::nullopt)
        : std::runtime_error(message), category_(category), offset_(offset) {}

    ErrorCategory category() const { return category_; }
    std::optional<uint64_t> offset() const { return offset_; }

private:
    ErrorCategory category_;
    std::optional<uint64_t> offset_;
};

class IoError : public AggregationError {
public:
    explicit IoError(const std::string& message, std::optional<uint64_t> offset = std::nullopt)
        : AggregationError(ErrorCategory::Io, message, offset) {}
};

class AlignmentError : public AggregationError {
public:
    AlignmentError(const std::string& message, uint64_t offset)
        : AggregationError(ErrorCategory::Alignment, message, offset) {}
};

class FormatError : public AggregationError {
public:
    explicit FormatError(const std::string& message, std::optional<uint64_t> offset = std::nullopt)
        : AggregationError(ErrorCategory::Format, message, offset) {}
};

// One-line diagnostic used by the command-line tools, ex: "Error [format] at offset 42: ..."
inline std::string describe_error(const AggregationError& e) {
    std::string text = "Error [" + std::string(category_name(e.category())) + "]";
    if (e.offset()) {
        text += " at offset " + std::to_string(*e.offset());
    }
    return text + ": " + e.what();
}
