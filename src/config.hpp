#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace relay_guard {

struct Backend {
    std::string host;
    uint16_t port = 0;
};

struct ListenEndpoint {
    std::string address = "0.0.0.0";
    uint16_t port = 25565;
};

struct LogSettings {
    std::string directory = "logs";
    std::string file = "proxy.log";
};

struct AppConfig {
    ListenEndpoint listener;
    Backend backend;
    int backlog = 5;
    std::size_t buffer_size = 4096;
    std::string allow_list_path = "allowed_ips.json";
    LogSettings log;
};

// Load configuration from JSON, or return defaults when the file is missing/invalid.
AppConfig load_config(const std::string& config_path, std::ostream& log);

AppConfig make_default_config();

} // namespace relay_guard
