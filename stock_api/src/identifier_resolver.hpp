#pragma once
#include "stock_store.hpp"
#include "types.hpp"
#include <string>

class IdentifierResolver {
public:
    explicit IdentifierResolver(const StockStore& store);

    // Throws DataError: NotFound when no stock has exactly this ticker,
    // SourceUnavailable when the store fails.
    StockId resolve(const std::string& ticker) const;

private:
    const StockStore& store_;
};
