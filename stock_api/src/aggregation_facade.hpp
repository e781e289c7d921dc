#pragma once

#include "identifier_resolver.hpp"
#include "prediction_joiner.hpp"
#include "stock_store.hpp"
#include "time_series_normalizer.hpp"
#include "time_series_parser.hpp"
#include "types.hpp"
#include <string>
#include <vector>

// Entry point for the read endpoints. Holds no mutable state; every call
// is independent and may run concurrently with others.
class AggregationFacade {
public:
    AggregationFacade(const StockStore& store, const std::string& data_dir);

    std::vector<Stock> list_stocks() const;

    // NotFound if the ticker is unknown.
    std::vector<Prediction> get_predictions(const std::string& ticker) const;

    // NotFound if the ticker is unknown or has no history file; the two
    // cases differ only in the message.
    std::vector<PricePoint> get_history(const std::string& ticker) const;

    bool is_store_healthy() const;

private:
    const StockStore& store_;
    IdentifierResolver resolver_;
    PredictionJoiner joiner_;
    TimeSeriesParser parser_;
    TimeSeriesNormalizer normalizer_;
};
