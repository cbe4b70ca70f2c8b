#include "gtest/gtest.h"
#include "../src/parsing/record_parser.hpp"
#include "../src/include/aggregation_error.hpp"

#include <string>
#include <vector>

namespace {

std::vector<Record> parse_all(std::string_view chunk, uint64_t file_offset = 0) {
    RecordParser parser(chunk, file_offset);
    std::vector<Record> records;
    Record record;
    while (parser.next(record)) {
        records.push_back(record);
    }
    return records;
}

} // namespace

TEST(RecordParserTest, SplitsKeyAndValue) {
    auto records = parse_all("Hamburg;12.0\nBulawayo;8.9\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].key, "Hamburg");
    EXPECT_DOUBLE_EQ(records[0].value, 12.0);
    EXPECT_EQ(records[1].key, "Bulawayo");
    EXPECT_DOUBLE_EQ(records[1].value, 8.9);
}

TEST(RecordParserTest, ReportsFileOffsets) {
    auto records = parse_all("AA;3.0\nBB;4.0\n", 1000);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].offset, 1000u);
    EXPECT_EQ(records[1].offset, 1007u);
}

TEST(RecordParserTest, SkipsEmptyLines) {
    auto records = parse_all("\nAA;1.0\n\n\nBB;2.0\n\n");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].key, "AA");
    EXPECT_EQ(records[1].key, "BB");
}

TEST(RecordParserTest, EmptyChunkHasNoRecords) {
    EXPECT_TRUE(parse_all("").empty());
    EXPECT_TRUE(parse_all("\n\n").empty());
}

TEST(RecordParserTest, LastRecordWithoutTerminator) {
    auto records = parse_all("AA;1.0\nBB;-2.5");
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[1].key, "BB");
    EXPECT_DOUBLE_EQ(records[1].value, -2.5);
}

TEST(RecordParserTest, SplitsOnFirstSeparatorOnly) {
    // everything after the first separator is the value
    EXPECT_THROW(parse_record("a;b;1.0", 0), FormatError);
    Record record = parse_record("key with spaces;7", 0);
    EXPECT_EQ(record.key, "key with spaces");
    EXPECT_DOUBLE_EQ(record.value, 7.0);
}

TEST(RecordParserTest, EmptyKeyIsAccepted) {
    Record record = parse_record(";1.5", 0);
    EXPECT_EQ(record.key, "");
    EXPECT_DOUBLE_EQ(record.value, 1.5);
}

TEST(RecordParserTest, MissingSeparatorIsAFormatError) {
    try {
        parse_all("AA;1.0\nnoseparator\n", 500);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::Format);
        ASSERT_TRUE(e.offset().has_value());
        EXPECT_EQ(*e.offset(), 507u);
    }
}

TEST(ParseValueTest, AcceptsSignsAndIntegers) {
    EXPECT_DOUBLE_EQ(parse_value("-12.3", 0), -12.3);
    EXPECT_DOUBLE_EQ(parse_value("+4.5", 0), 4.5);
    EXPECT_DOUBLE_EQ(parse_value("42", 0), 42.0);
    EXPECT_DOUBLE_EQ(parse_value("0.0", 0), 0.0);
    EXPECT_DOUBLE_EQ(parse_value("-0.1", 0), -0.1);
}

TEST(ParseValueTest, RejectsMalformedNumbers) {
    EXPECT_THROW(parse_value("", 0), FormatError);
    EXPECT_THROW(parse_value("+", 0), FormatError);
    EXPECT_THROW(parse_value("abc", 0), FormatError);
    EXPECT_THROW(parse_value("1.2.3", 0), FormatError);
    EXPECT_THROW(parse_value("12x", 0), FormatError);
    EXPECT_THROW(parse_value("+-1", 0), FormatError);
    EXPECT_THROW(parse_value(" 1.0", 0), FormatError);
}

TEST(ParseValueTest, BadNumberOffsetPointsAtValue) {
    try {
        parse_record("AA;oops", 100);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        ASSERT_TRUE(e.offset().has_value());
        EXPECT_EQ(*e.offset(), 103u);
    }
}

TEST(ParseValueTest, NonUtf8ValueIsAFormatError) {
    try {
        parse_value("1\xff", 0);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("UTF-8"), std::string::npos);
    }
}

TEST(Utf8Test, ValidSequences) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("Z\xc3\xbcrich"));          // Zürich
    EXPECT_TRUE(is_valid_utf8("\xe6\x9d\xb1\xe4\xba\xac")); // 東京
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));         // U+1F600
}

TEST(Utf8Test, InvalidSequences) {
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\x80"));             // stray continuation byte
    EXPECT_FALSE(is_valid_utf8("\xc3"));             // truncated
    EXPECT_FALSE(is_valid_utf8("\xe6\x9d"));         // truncated
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));         // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));     // surrogate U+D800
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80")); // above U+10FFFF
}
