#include "identifier_resolver.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

IdentifierResolver::IdentifierResolver(const StockStore& store) : store_(store) {}

StockId IdentifierResolver::resolve(const std::string& ticker) const {
    if (ticker.empty()) {
        throw DataError::not_found("stock not found for empty ticker");
    }

    auto id = store_.find_stock_id(ticker);
    if (!id) {
        throw DataError::not_found(fmt::format("stock not found for ticker {}", ticker));
    }

    spdlog::debug("Resolved ticker '{}' to stock id {}", ticker, *id);
    return *id;
}
