#include "time_series_normalizer.hpp"
#include "util.hpp"
#include <algorithm>

std::vector<PricePoint> TimeSeriesNormalizer::normalize(StockId stock_id, const std::vector<RawBar>& bars) const {
    std::vector<PricePoint> points;
    points.reserve(bars.size());

    for (const auto& bar : bars) {
        PricePoint point;
        point.stock_id = stock_id;
        point.epoch_seconds = bar.timestamp;
        point.timestamp = util::format_iso8601_utc(bar.timestamp);
        point.price = bar.price;
        point.volume = bar.volume;
        points.push_back(std::move(point));
    }

    std::stable_sort(points.begin(), points.end(),
                     [](const PricePoint& a, const PricePoint& b) {
                         return a.epoch_seconds < b.epoch_seconds;
                     });

    return points;
}
