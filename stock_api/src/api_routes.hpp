#pragma once
#include "aggregation_facade.hpp"
#include "errors.hpp"
#include <string>

struct ApiReply {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

// Transport-independent handlers for the HTTP endpoints. Each handler runs
// exactly one facade operation and converts failures to a status code.
class ApiRoutes {
public:
    ApiRoutes(const AggregationFacade& facade, const std::string& service_name);

    ApiReply get_stocks() const;                               // GET /stocks
    ApiReply get_predictions(const std::string& ticker) const; // GET /predictions/{ticker}
    ApiReply get_history(const std::string& ticker) const;     // GET /stocks/{ticker}/history
    ApiReply get_health() const;                               // GET /health

    static int status_for(ErrorKind kind);

private:
    template <typename Func>
    ApiReply respond(const std::string& operation, Func handler) const;

    const AggregationFacade& facade_;
    std::string service_name_;
};
