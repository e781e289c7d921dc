#pragma once

#include "config.hpp"
#include "stock_store.hpp"
#include <memory>

class PostgresStockStore : public StockStore {
public:
    // Opens the first pooled connection eagerly; throws std::runtime_error
    // if the database is unreachable.
    explicit PostgresStockStore(const Config& config);
    ~PostgresStockStore() override;

    std::vector<Stock> list_stocks() const override;
    std::optional<StockId> find_stock_id(const std::string& ticker) const override;
    std::vector<Prediction> find_predictions(StockId stock_id) const override;
    bool is_healthy() const override;

    // Non-copyable
    PostgresStockStore(const PostgresStockStore&) = delete;
    PostgresStockStore& operator=(const PostgresStockStore&) = delete;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};
