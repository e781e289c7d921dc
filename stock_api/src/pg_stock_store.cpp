#include "pg_stock_store.hpp"
#include "errors.hpp"
#include <pqxx/pqxx>
#include <spdlog/spdlog.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

namespace {

constexpr auto kCheckoutTimeout = std::chrono::seconds(10);

template <typename T>
std::optional<T> optional_field(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<T>();
}

} // namespace

class PostgresStockStore::Impl {
public:
    explicit Impl(const Config& config)
        : conn_string_(config.db_conn_string()),
          pool_size_(static_cast<size_t>(config.db_pool_size)) {
        try {
            auto conn = std::make_unique<pqxx::connection>(conn_string_);
            if (!conn->is_open()) {
                throw std::runtime_error("PostgreSQL connection is not open");
            }
            idle_.push_back(std::move(conn));
            created_ = 1;
            spdlog::info("Connected to PostgreSQL database (pool size {})", pool_size_);
        } catch (const std::exception& e) {
            throw std::runtime_error(fmt::format("Failed to connect to PostgreSQL: {}", e.what()));
        }
    }

    std::vector<Stock> list_stocks() {
        return with_transaction("list_stocks", [](pqxx::read_transaction& txn) {
            pqxx::result result = txn.exec("SELECT id, ticker, name FROM stocks ORDER BY id");

            std::vector<Stock> stocks;
            stocks.reserve(result.size());
            for (const auto& row : result) {
                Stock stock;
                stock.id = row["id"].as<int64_t>();
                stock.ticker = row["ticker"].as<std::string>();
                stock.name = row["name"].is_null() ? std::string() : row["name"].as<std::string>();
                stocks.push_back(std::move(stock));
            }
            return stocks;
        });
    }

    std::optional<StockId> find_stock_id(const std::string& ticker) {
        return with_transaction("find_stock_id", [&ticker](pqxx::read_transaction& txn) {
            pqxx::result result = txn.exec_params(
                "SELECT id FROM stocks WHERE ticker = $1",
                ticker
            );

            std::optional<StockId> id;
            if (!result.empty()) {
                id = result[0]["id"].as<int64_t>();
            }
            return id;
        });
    }

    std::vector<Prediction> find_predictions(StockId stock_id) {
        return with_transaction("find_predictions", [stock_id](pqxx::read_transaction& txn) {
            pqxx::result result = txn.exec_params(
                "SELECT "
                "p.id, p.message_id, p.stock_id, p.prediction_type, "
                "p.target_price, p.target_change_percent, p.period, "
                "p.recommendation, p.direction, p.justification_text, "
                "m.text AS message_text, "
                "floor(EXTRACT(EPOCH FROM p.predicted_at))::bigint AS predicted_at "
                "FROM predictions p "
                "JOIN messages m ON p.message_id = m.telegram_id "
                "WHERE p.stock_id = $1 "
                "ORDER BY p.predicted_at DESC",
                stock_id
            );

            std::vector<Prediction> predictions;
            predictions.reserve(result.size());
            for (const auto& row : result) {
                Prediction p;
                p.id = row["id"].as<int64_t>();
                p.message_id = row["message_id"].as<int64_t>();
                p.stock_id = row["stock_id"].as<int64_t>();
                p.prediction_type = optional_field<std::string>(row["prediction_type"]);
                p.target_price = optional_field<double>(row["target_price"]);
                p.target_change_percent = optional_field<double>(row["target_change_percent"]);
                p.period = optional_field<std::string>(row["period"]);
                p.recommendation = optional_field<std::string>(row["recommendation"]);
                p.direction = optional_field<std::string>(row["direction"]);
                p.justification_text = optional_field<std::string>(row["justification_text"]);
                p.message_text = optional_field<std::string>(row["message_text"]);
                p.predicted_at = row["predicted_at"].as<int64_t>();
                predictions.push_back(std::move(p));
            }
            return predictions;
        });
    }

    bool is_healthy() {
        try {
            return with_transaction("health_check", [](pqxx::read_transaction& txn) {
                txn.exec("SELECT 1");
                return true;
            });
        } catch (const DataError& e) {
            spdlog::error("Database health check failed: {}", e.what());
            return false;
        }
    }

private:
    // Returns its connection to the pool on every exit path. A connection
    // marked broken is dropped and replaced on a later checkout.
    class Lease {
    public:
        Lease(Impl& owner, std::unique_ptr<pqxx::connection> conn)
            : owner_(owner), conn_(std::move(conn)) {}
        ~Lease() { owner_.release(std::move(conn_), broken_); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        pqxx::connection& connection() { return *conn_; }
        void mark_broken() { broken_ = true; }

    private:
        Impl& owner_;
        std::unique_ptr<pqxx::connection> conn_;
        bool broken_ = false;
    };

    template <typename Func>
    auto with_transaction(const std::string& operation, Func query_func) {
        Lease lease(*this, acquire(operation));
        try {
            pqxx::read_transaction txn(lease.connection());
            return query_func(txn);
        } catch (const pqxx::broken_connection& e) {
            lease.mark_broken();
            spdlog::error("Database connection lost during {}: {}", operation, e.what());
            throw DataError::unavailable(fmt::format("database connection lost during {}: {}", operation, e.what()));
        } catch (const pqxx::sql_error& e) {
            spdlog::error("SQL error during {}: {}", operation, e.what());
            throw DataError::unavailable(fmt::format("database query failed during {}: {}", operation, e.what()));
        } catch (const DataError&) {
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Error during {}: {}", operation, e.what());
            throw DataError::unavailable(fmt::format("database error during {}: {}", operation, e.what()));
        }
    }

    std::unique_ptr<pqxx::connection> acquire(const std::string& operation) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = available_.wait_for(lock, kCheckoutTimeout, [this]() {
            return !idle_.empty() || created_ < pool_size_;
        });
        if (!ready) {
            throw DataError::unavailable(fmt::format("timed out waiting for a database connection during {}", operation));
        }

        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return conn;
        }

        ++created_;
        lock.unlock();
        try {
            auto conn = std::make_unique<pqxx::connection>(conn_string_);
            spdlog::debug("Opened pooled PostgreSQL connection for {}", operation);
            return conn;
        } catch (const std::exception& e) {
            lock.lock();
            --created_;
            available_.notify_one();
            spdlog::error("Cannot open PostgreSQL connection during {}: {}", operation, e.what());
            throw DataError::unavailable(fmt::format("cannot connect to database during {}: {}", operation, e.what()));
        }
    }

    void release(std::unique_ptr<pqxx::connection> conn, bool broken) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!conn || broken || !conn->is_open()) {
            --created_;
        } else {
            idle_.push_back(std::move(conn));
        }
        available_.notify_one();
    }

    std::string conn_string_;
    size_t pool_size_;

    std::mutex mutex_;
    std::condition_variable available_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    size_t created_ = 0;
};

// PostgresStockStore implementation using the Impl class
PostgresStockStore::PostgresStockStore(const Config& config)
    : impl_(std::make_unique<Impl>(config)) {}

PostgresStockStore::~PostgresStockStore() = default;

std::vector<Stock> PostgresStockStore::list_stocks() const {
    return impl_->list_stocks();
}

std::optional<StockId> PostgresStockStore::find_stock_id(const std::string& ticker) const {
    return impl_->find_stock_id(ticker);
}

std::vector<Prediction> PostgresStockStore::find_predictions(StockId stock_id) const {
    return impl_->find_predictions(stock_id);
}

bool PostgresStockStore::is_healthy() const {
    return impl_->is_healthy();
}
