#pragma once
#include "types.hpp"
#include <vector>

// Turns parsed bars into price points ordered by time, oldest first, with
// RFC 3339 UTC timestamps. Bars sharing a timestamp keep their input order.
class TimeSeriesNormalizer {
public:
    std::vector<PricePoint> normalize(StockId stock_id, const std::vector<RawBar>& bars) const;
};
