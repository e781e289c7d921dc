#pragma once
#include "stock_store.hpp"
#include "types.hpp"
#include <vector>

class PredictionJoiner {
public:
    explicit PredictionJoiner(const StockStore& store);

    // Newest first. Rows sharing a predicted_at keep the store's order.
    // An empty result is not an error.
    std::vector<Prediction> list_predictions(StockId stock_id) const;

private:
    const StockStore& store_;
};
