#pragma once
#include <string>
#include <stdexcept>

class Config {
public:
    // Service info
    std::string service_name = "stock_api";
    std::string log_level = "info";

    // Database. A non-empty database_url wins over the individual fields.
    std::string database_url;
    std::string db_host = "localhost";
    int db_port = 5432;
    std::string db_user = "postgres";
    std::string db_password;
    std::string db_name = "postgres";
    std::string db_sslmode = "disable";
    int db_pool_size = 4;

    // Price history files
    std::string data_dir = "data";

    // HTTP
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8080;
    std::string cors_origin = "http://localhost:5173";

    static Config from_env();

    // Applies environment variables on top of the current values.
    void load_env();

    // Overlays values from a JSON file; throws std::runtime_error if the
    // file cannot be read or parsed.
    void load_file(const std::string& path);

    void validate() const;

    std::string db_conn_string() const;
};
