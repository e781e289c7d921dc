#include "time_series_parser.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

bool is_safe_ticker(const std::string& ticker) {
    return !ticker.empty() &&
           ticker.find('/') == std::string::npos &&
           ticker.find('\\') == std::string::npos &&
           ticker.find('\0') == std::string::npos &&
           ticker.find("..") == std::string::npos;
}

} // namespace

const char* to_string(RecordOutcome outcome) {
    switch (outcome) {
        case RecordOutcome::Accepted:
            return "accepted";
        case RecordOutcome::DroppedTooFewFields:
            return "too_few_fields";
        case RecordOutcome::DroppedBadTimestamp:
            return "bad_timestamp";
        case RecordOutcome::DroppedBadPrice:
            return "bad_price";
    }
    return "unknown";
}

TimeSeriesParser::TimeSeriesParser(std::string data_dir) : data_dir_(std::move(data_dir)) {}

std::string TimeSeriesParser::file_path_for(const std::string& ticker) const {
    return (fs::path(data_dir_) / (ticker + "_D1.csv")).string();
}

ParseResult TimeSeriesParser::parse(const std::string& ticker) const {
    if (!is_safe_ticker(ticker)) {
        throw DataError::not_found(fmt::format("price history file not found for ticker {}", ticker));
    }

    const std::string path = file_path_for(ticker);

    std::error_code ec;
    bool exists = fs::is_regular_file(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory) {
        throw DataError::unavailable(fmt::format(
            "error checking price history file for ticker {}: {}", ticker, ec.message()));
    }
    if (!exists) {
        throw DataError::not_found(fmt::format("price history file not found for ticker {}", ticker));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw DataError::unavailable(fmt::format("error opening price history file for ticker {}", ticker));
    }

    return parse_stream(file, path);
}

ParseResult TimeSeriesParser::parse_stream(std::istream& in, const std::string& source) const {
    ParseResult result;
    ParseStats& stats = result.stats;

    std::string line;
    size_t line_no = 0;
    bool first_record = true;

    while (std::getline(in, line)) {
        ++line_no;
        line = util::strip_line_ending(line);
        if (line.empty()) {
            continue;
        }

        auto fields = util::split_csv_line(line);

        if (first_record) {
            first_record = false;
            if (fields[kTimestampField].find("Time") != std::string::npos) {
                stats.header_skipped = true;
                continue;
            }
        }

        ++stats.records;
        RecordResult record = parse_record(fields, line_no);
        switch (record.outcome) {
            case RecordOutcome::Accepted:
                ++stats.accepted;
                if (record.bar.volume_defaulted) {
                    ++stats.volume_defaulted;
                }
                result.bars.push_back(record.bar);
                break;
            case RecordOutcome::DroppedTooFewFields:
                ++stats.too_few_fields;
                break;
            case RecordOutcome::DroppedBadTimestamp:
                ++stats.bad_timestamp;
                break;
            case RecordOutcome::DroppedBadPrice:
                ++stats.bad_price;
                break;
        }

        if (record.outcome != RecordOutcome::Accepted) {
            spdlog::debug("{}:{}: record dropped ({})", source, line_no, to_string(record.outcome));
        }
    }

    if (in.bad()) {
        throw DataError::unavailable(fmt::format("error reading price history file {} at line {}", source, line_no));
    }

    spdlog::info("Parsed {}: {} records, {} accepted, {} dropped "
                 "(too_few_fields={}, bad_timestamp={}, bad_price={}), {} volumes defaulted",
                 source, stats.records, stats.accepted, stats.dropped(),
                 stats.too_few_fields, stats.bad_timestamp, stats.bad_price,
                 stats.volume_defaulted);

    return result;
}

RecordResult TimeSeriesParser::parse_record(const std::vector<std::string>& fields, size_t line_no) {
    RecordResult result;

    if (fields.size() < kMinFields) {
        result.outcome = RecordOutcome::DroppedTooFewFields;
        return result;
    }

    auto timestamp = util::parse_bar_timestamp(fields[kTimestampField]);
    if (!timestamp) {
        result.outcome = RecordOutcome::DroppedBadTimestamp;
        return result;
    }

    auto price = util::parse_double(fields[kPriceField]);
    if (!price || !std::isfinite(*price) || *price < 0.0) {
        result.outcome = RecordOutcome::DroppedBadPrice;
        return result;
    }

    // Volume is supplementary: a bad value never costs the record.
    auto volume = util::parse_int64(fields[kVolumeField]);
    bool volume_ok = volume && *volume >= 0;

    result.outcome = RecordOutcome::Accepted;
    result.bar.timestamp = *timestamp;
    result.bar.price = *price;
    result.bar.volume = volume_ok ? *volume : 0;
    result.bar.volume_defaulted = !volume_ok;
    result.bar.source_line = line_no;
    return result;
}
