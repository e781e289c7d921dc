#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

using StockId = int64_t;

struct Stock {
    StockId id = 0;
    std::string ticker;
    std::string name;
};

inline bool operator==(const Stock& a, const Stock& b) {
    return a.id == b.id && a.ticker == b.ticker && a.name == b.name;
}

// `id` is the storage key. The 1..N number a client sees is assigned at
// serialization time and is never stored here.
struct Prediction {
    int64_t id = 0;
    int64_t message_id = 0;
    StockId stock_id = 0;
    std::optional<std::string> prediction_type;
    std::optional<double> target_price;
    std::optional<double> target_change_percent;
    std::optional<std::string> period;
    std::optional<std::string> recommendation;
    std::optional<std::string> direction;
    std::optional<std::string> justification_text;
    std::optional<std::string> message_text;
    int64_t predicted_at = 0; // seconds since epoch, UTC
};

// One accepted CSV record, before normalization.
struct RawBar {
    int64_t timestamp = 0; // seconds since epoch, UTC
    double price = 0.0;
    int64_t volume = 0;
    bool volume_defaulted = false;
    size_t source_line = 0;
};

struct PricePoint {
    StockId stock_id = 0;
    int64_t epoch_seconds = 0;
    std::string timestamp; // RFC 3339, e.g. 2025-09-15T00:00:00Z
    double price = 0.0;
    int64_t volume = 0;
};
