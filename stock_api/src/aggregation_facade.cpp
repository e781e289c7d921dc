#include "aggregation_facade.hpp"
#include <spdlog/spdlog.h>

AggregationFacade::AggregationFacade(const StockStore& store, const std::string& data_dir)
    : store_(store),
      resolver_(store),
      joiner_(store),
      parser_(data_dir) {}

std::vector<Stock> AggregationFacade::list_stocks() const {
    spdlog::debug("Listing stocks");
    auto stocks = store_.list_stocks();
    spdlog::info("Returning {} stocks", stocks.size());
    return stocks;
}

std::vector<Prediction> AggregationFacade::get_predictions(const std::string& ticker) const {
    spdlog::debug("Fetching predictions for ticker '{}'", ticker);
    StockId stock_id = resolver_.resolve(ticker);
    auto predictions = joiner_.list_predictions(stock_id);
    spdlog::info("Found {} predictions for ticker '{}'", predictions.size(), ticker);
    return predictions;
}

std::vector<PricePoint> AggregationFacade::get_history(const std::string& ticker) const {
    spdlog::debug("Fetching price history for ticker '{}'", ticker);
    StockId stock_id = resolver_.resolve(ticker);
    ParseResult parsed = parser_.parse(ticker);
    auto points = normalizer_.normalize(stock_id, parsed.bars);
    spdlog::info("Found {} price history records for ticker '{}'", points.size(), ticker);
    return points;
}

bool AggregationFacade::is_store_healthy() const {
    return store_.is_healthy();
}
