#include "prediction_joiner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

PredictionJoiner::PredictionJoiner(const StockStore& store) : store_(store) {}

std::vector<Prediction> PredictionJoiner::list_predictions(StockId stock_id) const {
    auto predictions = store_.find_predictions(stock_id);

    // The store is asked for this order already; enforce it so every store
    // implementation yields the same sequence.
    std::stable_sort(predictions.begin(), predictions.end(),
                     [](const Prediction& a, const Prediction& b) {
                         return a.predicted_at > b.predicted_at;
                     });

    spdlog::debug("Joined {} predictions for stock id {}", predictions.size(), stock_id);
    return predictions;
}
