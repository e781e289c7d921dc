#pragma once
#include "api_routes.hpp"
#include "config.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class ApiServer {
public:
    ApiServer(const Config& config, const ApiRoutes& routes);
    ~ApiServer();

    // Binds the listening socket on the calling thread (throws
    // std::runtime_error on failure), then serves on a background thread.
    // Returns once the server accepts connections, so stop() is always safe.
    void start();
    void stop();
    bool is_running() const;

    // Bound port; differs from Config::listen_port only when that is 0.
    int port() const;

private:
    void setup_routes();
    void apply_cors_headers(httplib::Response& res) const;
    static void send(const ApiReply& reply, httplib::Response& res);

    const Config& config_;
    const ApiRoutes& routes_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;
    int port_ = -1;
};
