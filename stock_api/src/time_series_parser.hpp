#pragma once
#include "types.hpp"
#include <istream>
#include <string>
#include <vector>

enum class RecordOutcome {
    Accepted,
    DroppedTooFewFields,
    DroppedBadTimestamp,
    DroppedBadPrice
};

const char* to_string(RecordOutcome outcome);

struct RecordResult {
    RecordOutcome outcome = RecordOutcome::Accepted;
    RawBar bar; // meaningful only when outcome == Accepted
};

struct ParseStats {
    size_t records = 0;
    size_t accepted = 0;
    size_t too_few_fields = 0;
    size_t bad_timestamp = 0;
    size_t bad_price = 0;
    size_t volume_defaulted = 0;
    bool header_skipped = false;

    size_t dropped() const { return too_few_fields + bad_timestamp + bad_price; }
};

struct ParseResult {
    std::vector<RawBar> bars; // file order
    ParseStats stats;
};

// Reads <data_dir>/<ticker>_D1.csv. Columns: [0] "YYYY.MM.DD HH:MM:SS",
// [4] close price, [7] real volume. Malformed records are dropped, an
// unparsable volume becomes 0.
class TimeSeriesParser {
public:
    static constexpr size_t kMinFields = 8;
    static constexpr size_t kTimestampField = 0;
    static constexpr size_t kPriceField = 4;
    static constexpr size_t kVolumeField = 7;

    explicit TimeSeriesParser(std::string data_dir);

    // Throws DataError: NotFound when the file does not exist,
    // SourceUnavailable when it exists but cannot be read.
    ParseResult parse(const std::string& ticker) const;

    // Parses already-opened CSV content. `source` names it in logs.
    ParseResult parse_stream(std::istream& in, const std::string& source) const;

    static RecordResult parse_record(const std::vector<std::string>& fields, size_t line_no);

    std::string file_path_for(const std::string& ticker) const;

private:
    std::string data_dir_;
};
