#pragma once
#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

// Read-only view of the relational store. Implementations throw DataError
// with ErrorKind::SourceUnavailable when the store cannot answer, and must
// tolerate concurrent calls.
class StockStore {
public:
    virtual ~StockStore() = default;

    virtual std::vector<Stock> list_stocks() const = 0;

    // Exact, case-sensitive ticker match.
    virtual std::optional<StockId> find_stock_id(const std::string& ticker) const = 0;

    // Predictions for a stock joined with their message text, newest first.
    virtual std::vector<Prediction> find_predictions(StockId stock_id) const = 0;

    virtual bool is_healthy() const = 0;
};
