#include "json_schemas.hpp"
#include <optional>
#include <string>

using json = nlohmann::json;

namespace {

template <typename T>
json nullable(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

json stock_to_json(const Stock& stock) {
    json j;
    j["id"] = stock.id;
    j["ticker"] = stock.ticker;
    j["name"] = stock.name;
    return j;
}

json stocks_to_json(const std::vector<Stock>& stocks) {
    json result = json::array();
    for (const auto& stock : stocks) {
        result.push_back(stock_to_json(stock));
    }
    return result;
}

json prediction_to_json(const Prediction& prediction, int64_t display_index) {
    json j;
    j["ID"] = display_index;
    j["MessageID"] = display_index;
    j["StockID"] = prediction.stock_id;
    j["PredictionType"] = nullable(prediction.prediction_type);
    j["TargetPrice"] = nullable(prediction.target_price);
    j["TargetChangePercent"] = nullable(prediction.target_change_percent);
    j["Period"] = nullable(prediction.period);
    j["Recommendation"] = nullable(prediction.recommendation);
    j["Direction"] = nullable(prediction.direction);
    j["JustificationText"] = nullable(prediction.justification_text);
    j["Message"] = prediction.message_text.value_or("");
    j["PredictedAt"] = std::to_string(prediction.predicted_at);
    return j;
}

json predictions_to_json(const std::vector<Prediction>& predictions) {
    json result = json::array();
    int64_t display_index = 1;
    for (const auto& prediction : predictions) {
        result.push_back(prediction_to_json(prediction, display_index++));
    }
    return result;
}

json price_point_to_json(const PricePoint& point) {
    json j;
    j["StockID"] = point.stock_id;
    j["Timestamp"] = point.timestamp;
    j["Price"] = point.price;
    if (point.volume != 0) {
        j["Volume"] = point.volume;
    }
    return j;
}

json price_history_to_json(const std::vector<PricePoint>& points) {
    json result = json::array();
    for (const auto& point : points) {
        result.push_back(price_point_to_json(point));
    }
    return result;
}
