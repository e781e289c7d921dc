#include <gtest/gtest.h>
#include "errors.hpp"
#include "time_series_parser.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class TimeSeriesParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        data_dir_ = fs::temp_directory_path() /
                    (std::string("stock_api_parser_") + info->name());
        fs::remove_all(data_dir_);
        fs::create_directories(data_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(data_dir_, ec);
    }

    void write_file(const std::string& ticker, const std::string& content) {
        std::ofstream out(data_dir_ / (ticker + "_D1.csv"), std::ios::binary);
        out << content;
    }

    ParseResult parse(const std::string& content) {
        std::istringstream in(content);
        return TimeSeriesParser(data_dir_.string()).parse_stream(in, "test.csv");
    }

    fs::path data_dir_;
};

TEST_F(TimeSeriesParserTest, ParsesCloseAndRealVolume) {
    write_file("AAA", "2025.09.15 00:00:00,1,1,1,123.45,1,1,1000\n");

    ParseResult result = TimeSeriesParser(data_dir_.string()).parse("AAA");

    ASSERT_EQ(result.bars.size(), 1u);
    EXPECT_EQ(result.bars[0].timestamp, 1757894400);
    EXPECT_DOUBLE_EQ(result.bars[0].price, 123.45);
    EXPECT_EQ(result.bars[0].volume, 1000);
    EXPECT_FALSE(result.bars[0].volume_defaulted);
    EXPECT_EQ(result.bars[0].source_line, 1u);
}

TEST_F(TimeSeriesParserTest, SkipsHeaderOnFirstLine) {
    auto result = parse(
        "Time,Open,High,Low,Close,TickVolume,Spread,RealVolume\n"
        "2025.09.15 00:00:00,1,1,1,10.5,1,1,100\n");

    EXPECT_TRUE(result.stats.header_skipped);
    EXPECT_EQ(result.stats.records, 1u);
    ASSERT_EQ(result.bars.size(), 1u);
    EXPECT_DOUBLE_EQ(result.bars[0].price, 10.5);
}

TEST_F(TimeSeriesParserTest, HeaderDetectionOnlyAppliesToFirstRecord) {
    auto result = parse(
        "2025.09.15 00:00:00,1,1,1,10.5,1,1,100\n"
        "Time,Open,High,Low,Close,TickVolume,Spread,RealVolume\n");

    EXPECT_FALSE(result.stats.header_skipped);
    EXPECT_EQ(result.stats.records, 2u);
    EXPECT_EQ(result.stats.bad_timestamp, 1u);
    EXPECT_EQ(result.bars.size(), 1u);
}

TEST_F(TimeSeriesParserTest, FirstDataLineIsNotMistakenForHeader) {
    auto result = parse("2025.09.15 00:00:00,1,1,1,10.5,1,1,100\n");

    EXPECT_FALSE(result.stats.header_skipped);
    EXPECT_EQ(result.bars.size(), 1u);
}

TEST_F(TimeSeriesParserTest, DropsRecordsWithTooFewFields) {
    auto result = parse(
        "2025.09.15 00:00:00,1,1,1,10.5\n"
        "2025.09.16 00:00:00,1,1,1,11.5,1,1\n"
        "2025.09.17 00:00:00,1,1,1,12.5,1,1,300\n");

    EXPECT_EQ(result.stats.too_few_fields, 2u);
    ASSERT_EQ(result.bars.size(), 1u);
    EXPECT_DOUBLE_EQ(result.bars[0].price, 12.5);
}

TEST_F(TimeSeriesParserTest, AcceptsExtraFields) {
    auto result = parse("2025.09.15 00:00:00,1,1,1,10.5,1,1,100,extra,more\n");

    ASSERT_EQ(result.bars.size(), 1u);
    EXPECT_EQ(result.bars[0].volume, 100);
}

TEST_F(TimeSeriesParserTest, DropsRecordsWithBadTimestamp) {
    auto result = parse(
        "2025-09-15 00:00:00,1,1,1,10.5,1,1,100\n"
        "2025.02.30 00:00:00,1,1,1,10.5,1,1,100\n"
        "yesterday,1,1,1,10.5,1,1,100\n");

    EXPECT_EQ(result.stats.bad_timestamp, 3u);
    EXPECT_TRUE(result.bars.empty());
}

TEST_F(TimeSeriesParserTest, DropsRecordsWithBadPriceEvenWithGoodVolume) {
    auto result = parse(
        "2025.09.15 00:00:00,1,1,1,n/a,1,1,100\n"
        "2025.09.16 00:00:00,1,1,1,,1,1,100\n"
        "2025.09.17 00:00:00,1,1,1,-3.5,1,1,100\n"
        "2025.09.18 00:00:00,1,1,1,nan,1,1,100\n"
        "2025.09.19 00:00:00,1,1,1,inf,1,1,100\n"
        "2025.09.22 00:00:00,1,1,1,0x1A,1,1,100\n");

    EXPECT_EQ(result.stats.bad_price, 6u);
    EXPECT_TRUE(result.bars.empty());
}

TEST_F(TimeSeriesParserTest, DefaultsUnparsableVolumeToZero) {
    auto result = parse(
        "2025.09.15 00:00:00,1,1,1,10.5,1,1,lots\n"
        "2025.09.16 00:00:00,1,1,1,11.5,1,1,\n"
        "2025.09.17 00:00:00,1,1,1,12.5,1,1,-4\n"
        "2025.09.18 00:00:00,1,1,1,13.5,1,1,7.5\n");

    ASSERT_EQ(result.bars.size(), 4u);
    for (const auto& bar : result.bars) {
        EXPECT_EQ(bar.volume, 0);
        EXPECT_TRUE(bar.volume_defaulted);
    }
    EXPECT_EQ(result.stats.volume_defaulted, 4u);
    EXPECT_EQ(result.stats.dropped(), 0u);
}

TEST_F(TimeSeriesParserTest, ToleratesCrlfAndBlankLines) {
    auto result = parse(
        "Time,Open,High,Low,Close,TickVolume,Spread,RealVolume\r\n"
        "\r\n"
        "2025.09.15 00:00:00,1,1,1,10.5,1,1,100\r\n"
        "\n"
        "2025.09.16 00:00:00,1,1,1,11.5,1,1,200\r\n");

    EXPECT_TRUE(result.stats.header_skipped);
    ASSERT_EQ(result.bars.size(), 2u);
    EXPECT_EQ(result.bars[1].volume, 200);
    EXPECT_EQ(result.bars[1].source_line, 5u);
}

TEST_F(TimeSeriesParserTest, ParsesQuotedFields) {
    auto result = parse(R"("2025.09.15 00:00:00","1","1","1","10.5","1","1","100")" "\n");

    ASSERT_EQ(result.bars.size(), 1u);
    EXPECT_DOUBLE_EQ(result.bars[0].price, 10.5);
    EXPECT_EQ(result.bars[0].volume, 100);
}

TEST_F(TimeSeriesParserTest, KeepsFileOrder) {
    auto result = parse(
        "2025.09.17 00:00:00,1,1,1,3,1,1,1\n"
        "2025.09.15 00:00:00,1,1,1,1,1,1,1\n"
        "2025.09.16 00:00:00,1,1,1,2,1,1,1\n");

    ASSERT_EQ(result.bars.size(), 3u);
    EXPECT_DOUBLE_EQ(result.bars[0].price, 3.0);
    EXPECT_DOUBLE_EQ(result.bars[1].price, 1.0);
    EXPECT_DOUBLE_EQ(result.bars[2].price, 2.0);
}

TEST_F(TimeSeriesParserTest, CountsEveryOutcome) {
    auto result = parse(
        "Time,Open,High,Low,Close,TickVolume,Spread,RealVolume\n"
        "2025.09.15 00:00:00,1,1,1,10.5,1,1,100\n"
        "2025.09.16 00:00:00,1,1,1,11.5,1,1,x\n"
        "2025.09.17 00:00:00,1,1\n"
        "bad,1,1,1,10.5,1,1,100\n"
        "2025.09.18 00:00:00,1,1,1,x,1,1,100\n");

    const ParseStats& stats = result.stats;
    EXPECT_EQ(stats.records, 5u);
    EXPECT_EQ(stats.accepted, 2u);
    EXPECT_EQ(stats.too_few_fields, 1u);
    EXPECT_EQ(stats.bad_timestamp, 1u);
    EXPECT_EQ(stats.bad_price, 1u);
    EXPECT_EQ(stats.volume_defaulted, 1u);
    EXPECT_EQ(stats.dropped(), 3u);
}

TEST_F(TimeSeriesParserTest, EmptyFileYieldsNoBars) {
    write_file("EMPTY", "");

    ParseResult result = TimeSeriesParser(data_dir_.string()).parse("EMPTY");

    EXPECT_TRUE(result.bars.empty());
    EXPECT_EQ(result.stats.records, 0u);
}

TEST_F(TimeSeriesParserTest, MissingFileIsNotFound) {
    TimeSeriesParser parser(data_dir_.string());

    try {
        parser.parse("ZZZ");
        FAIL() << "expected DataError";
    } catch (const DataError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        EXPECT_NE(std::string(e.what()).find("ZZZ"), std::string::npos);
    }
}

TEST_F(TimeSeriesParserTest, TickerIsCaseSensitiveForFileLookup) {
    write_file("AAA", "2025.09.15 00:00:00,1,1,1,1,1,1,1\n");
    TimeSeriesParser parser(data_dir_.string());

    EXPECT_NO_THROW(parser.parse("AAA"));
    if (!fs::exists(data_dir_ / "aaa_D1.csv")) {
        EXPECT_THROW(parser.parse("aaa"), DataError);
    }
}

TEST_F(TimeSeriesParserTest, TickersCannotEscapeDataDirectory) {
    fs::create_directories(data_dir_ / "nested");
    write_file("nested/AAA", "2025.09.15 00:00:00,1,1,1,1,1,1,1\n");
    TimeSeriesParser parser(data_dir_.string());

    for (const std::string ticker : {"nested/AAA", "../AAA", "..", ""}) {
        try {
            parser.parse(ticker);
            FAIL() << "expected DataError for '" << ticker << "'";
        } catch (const DataError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::NotFound);
        }
    }
}

TEST_F(TimeSeriesParserTest, DirectoryInPlaceOfFileIsNotFound) {
    fs::create_directories(data_dir_ / "DIR_D1.csv");
    TimeSeriesParser parser(data_dir_.string());

    try {
        parser.parse("DIR");
        FAIL() << "expected DataError";
    } catch (const DataError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST(TimeSeriesParserPathTest, BuildsFileNameFromTicker) {
    TimeSeriesParser parser("data");
    EXPECT_EQ(parser.file_path_for("AAPL"), "data/AAPL_D1.csv");
}

TEST(ParseRecordTest, ReportsOutcomeForEachRule) {
    using Fields = std::vector<std::string>;

    EXPECT_EQ(TimeSeriesParser::parse_record(Fields{"2025.09.15 00:00:00", "1", "1"}, 1).outcome,
              RecordOutcome::DroppedTooFewFields);
    EXPECT_EQ(TimeSeriesParser::parse_record(Fields{"x", "1", "1", "1", "1", "1", "1", "1"}, 1).outcome,
              RecordOutcome::DroppedBadTimestamp);
    EXPECT_EQ(TimeSeriesParser::parse_record(Fields{"2025.09.15 00:00:00", "1", "1", "1", "x", "1", "1", "1"}, 1).outcome,
              RecordOutcome::DroppedBadPrice);

    RecordResult ok = TimeSeriesParser::parse_record(
        Fields{"2025.09.15 00:00:00", "1", "1", "1", "0", "1", "1", "5"}, 9);
    EXPECT_EQ(ok.outcome, RecordOutcome::Accepted);
    EXPECT_DOUBLE_EQ(ok.bar.price, 0.0);
    EXPECT_EQ(ok.bar.volume, 5);
    EXPECT_EQ(ok.bar.source_line, 9u);
}
