#pragma once
#include "types.hpp"
#include <vector>
#include <nlohmann/json.hpp>

nlohmann::json stock_to_json(const Stock& stock);
nlohmann::json stocks_to_json(const std::vector<Stock>& stocks);

// "ID" and "MessageID" carry the position of the prediction in this
// response (1..N). They are not storage keys and change between responses.
nlohmann::json prediction_to_json(const Prediction& prediction, int64_t display_index);
nlohmann::json predictions_to_json(const std::vector<Prediction>& predictions);

// "Volume" is omitted when zero.
nlohmann::json price_point_to_json(const PricePoint& point);
nlohmann::json price_history_to_json(const std::vector<PricePoint>& points);
