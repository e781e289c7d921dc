#include "api_routes.hpp"
#include "json_schemas.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

ApiRoutes::ApiRoutes(const AggregationFacade& facade, const std::string& service_name)
    : facade_(facade), service_name_(service_name) {}

int ApiRoutes::status_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:
            return 404;
        case ErrorKind::SourceUnavailable:
            return 500;
    }
    return 500;
}

template <typename Func>
ApiReply ApiRoutes::respond(const std::string& operation, Func handler) const {
    ApiReply reply;
    try {
        reply.body = handler().dump();
        reply.status = 200;
    } catch (const DataError& e) {
        spdlog::error("{} failed ({}): {}", operation, to_string(e.kind()), e.what());
        reply.status = status_for(e.kind());
        reply.body = e.what();
        reply.content_type = "text/plain";
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", operation, e.what());
        reply.status = 500;
        reply.body = e.what();
        reply.content_type = "text/plain";
    }
    return reply;
}

ApiReply ApiRoutes::get_stocks() const {
    return respond("list stocks", [this]() {
        return stocks_to_json(facade_.list_stocks());
    });
}

ApiReply ApiRoutes::get_predictions(const std::string& ticker) const {
    return respond(fmt::format("get predictions for ticker '{}'", ticker), [this, &ticker]() {
        return predictions_to_json(facade_.get_predictions(ticker));
    });
}

ApiReply ApiRoutes::get_history(const std::string& ticker) const {
    return respond(fmt::format("get price history for ticker '{}'", ticker), [this, &ticker]() {
        return price_history_to_json(facade_.get_history(ticker));
    });
}

ApiReply ApiRoutes::get_health() const {
    nlohmann::json health_status;
    health_status["service"] = service_name_;
    health_status["status"] = "healthy";
    health_status["timestamp"] = util::current_iso8601();

    bool db_healthy = facade_.is_store_healthy();
    health_status["components"]["database"] = db_healthy ? "healthy" : "unhealthy";

    ApiReply reply;
    if (!db_healthy) {
        health_status["status"] = "unhealthy";
        reply.status = 503;
    }
    reply.body = health_status.dump(2);
    return reply;
}
