#include "api_server.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

ApiServer::ApiServer(const Config& config, const ApiRoutes& routes)
    : config_(config), routes_(routes), running_(false) {
    server_ = std::make_unique<httplib::Server>();
    setup_routes();
}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start() {
    if (config_.listen_port == 0) {
        port_ = server_->bind_to_any_port(config_.listen_addr.c_str());
    } else if (server_->bind_to_port(config_.listen_addr.c_str(), config_.listen_port)) {
        port_ = config_.listen_port;
    }
    if (port_ <= 0) {
        throw std::runtime_error(fmt::format("Cannot bind HTTP server to {}:{}",
                                             config_.listen_addr, config_.listen_port));
    }
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("HTTP server listening on {}:{}", config_.listen_addr, port_);
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP server stopped unexpectedly");
        }
        running_ = false;
    });
    server_->wait_until_ready();
}

void ApiServer::stop() {
    if (server_thread_.joinable()) {
        server_->stop();
        server_thread_.join();
        spdlog::info("HTTP server stopped");
    }
    running_ = false;
}

bool ApiServer::is_running() const {
    return running_;
}

int ApiServer::port() const {
    return port_;
}

void ApiServer::apply_cors_headers(httplib::Response& res) const {
    res.set_header("Access-Control-Allow-Origin", config_.cors_origin);
    res.set_header("Access-Control-Allow-Methods", "GET, POST, PUT, DELETE, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
    res.set_header("Access-Control-Allow-Credentials", "true");
}

void ApiServer::send(const ApiReply& reply, httplib::Response& res) {
    res.status = reply.status;
    res.set_content(reply.body, reply.content_type.c_str());
}

void ApiServer::setup_routes() {
    server_->Get("/stocks", [this](const httplib::Request&, httplib::Response& res) {
        send(routes_.get_stocks(), res);
    });

    server_->Get(R"(/predictions/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        send(routes_.get_predictions(req.matches[1]), res);
    });

    server_->Get(R"(/stocks/([^/]+)/history)", [this](const httplib::Request& req, httplib::Response& res) {
        send(routes_.get_history(req.matches[1]), res);
    });

    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        send(routes_.get_health(), res);
    });

    // Preflight requests
    server_->Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        res.status = 200;
    });

    server_->set_post_routing_handler([this](const httplib::Request&, httplib::Response& res) {
        apply_cors_headers(res);
    });

    server_->set_error_handler([](const httplib::Request&, httplib::Response& res) {
        if (res.body.empty()) {
            res.set_content("Not Found", "text/plain");
        }
    });

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::info("{} {} -> {}", req.method, req.path, res.status);
    });
}
