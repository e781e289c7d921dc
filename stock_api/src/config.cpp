#include "config.hpp"
#include "util.hpp"
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

// libpq conninfo values are single-quoted with backslash escapes.
std::string quote_conninfo_value(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

template <typename T>
void read_if_present(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j.at(key).is_null()) {
        target = j.at(key).get<T>();
    }
}

} // namespace

Config Config::from_env() {
    Config config;
    config.load_env();
    return config;
}

void Config::load_env() {
    // Service
    service_name = util::get_env_var("SERVICE_NAME", service_name);
    log_level = util::get_env_var("LOG_LEVEL", log_level);

    // Database
    database_url = util::get_env_var("DATABASE_URL", database_url);
    db_host = util::get_env_var("DB_HOST", db_host);
    db_port = util::get_env_int("DB_PORT", db_port);
    db_user = util::get_env_var("DB_USER", db_user);
    db_password = util::get_env_var("DB_PASSWORD", db_password);
    db_name = util::get_env_var("DB_NAME", db_name);
    db_sslmode = util::get_env_var("DB_SSLMODE", db_sslmode);
    db_pool_size = util::get_env_int("DB_POOL_SIZE", db_pool_size);

    // Files
    data_dir = util::get_env_var("DATA_DIR", data_dir);

    // HTTP
    listen_addr = util::get_env_var("LISTEN_ADDR", listen_addr);
    listen_port = util::get_env_int("LISTEN_PORT", listen_port);
    cors_origin = util::get_env_var("CORS_ORIGIN", cors_origin);
}

void Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    try {
        read_if_present(j, "service_name", service_name);
        read_if_present(j, "log_level", log_level);
        read_if_present(j, "data_dir", data_dir);
        read_if_present(j, "listen_addr", listen_addr);
        read_if_present(j, "listen_port", listen_port);
        read_if_present(j, "cors_origin", cors_origin);

        if (j.contains("database")) {
            const auto& db = j.at("database");
            read_if_present(db, "url", database_url);
            read_if_present(db, "host", db_host);
            read_if_present(db, "port", db_port);
            read_if_present(db, "user", db_user);
            read_if_present(db, "password", db_password);
            read_if_present(db, "dbname", db_name);
            read_if_present(db, "sslmode", db_sslmode);
            read_if_present(db, "pool_size", db_pool_size);
        }
    } catch (const json::exception& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }

    spdlog::debug("Configuration file {} applied", path);
}

void Config::validate() const {
    if (database_url.empty() && db_host.empty()) {
        throw std::runtime_error("Either DATABASE_URL or DB_HOST is required");
    }

    if (db_port <= 0 || db_port > 65535) {
        throw std::runtime_error("DB_PORT must be between 1 and 65535");
    }

    if (db_pool_size <= 0) {
        throw std::runtime_error("DB_POOL_SIZE must be positive");
    }

    if (data_dir.empty()) {
        throw std::runtime_error("DATA_DIR cannot be empty");
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    spdlog::info("Configuration validated successfully");
}

std::string Config::db_conn_string() const {
    if (!database_url.empty()) {
        return database_url;
    }

    std::string conn = "host=" + quote_conninfo_value(db_host) +
                       " port=" + std::to_string(db_port) +
                       " user=" + quote_conninfo_value(db_user) +
                       " dbname=" + quote_conninfo_value(db_name) +
                       " sslmode=" + quote_conninfo_value(db_sslmode);
    if (!db_password.empty()) {
        conn += " password=" + quote_conninfo_value(db_password);
    }
    return conn;
}
