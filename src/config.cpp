#include "config.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <algorithm>
#include <fstream>

namespace pt = boost::property_tree;

namespace relay_guard {

namespace {

constexpr std::size_t kMinBuffer = 512;
constexpr std::size_t kMaxBuffer = 64 * 1024;

Backend parse_backend(const pt::ptree& node, const Backend& fallback) {
    Backend backend = fallback;
    backend.host = node.get<std::string>("host", backend.host);
    backend.port = node.get<uint16_t>("port", backend.port);
    return backend;
}

} // namespace

AppConfig make_default_config() {
    AppConfig config;
    config.listener = {"0.0.0.0", 25565};
    config.backend = {"127.0.0.1", 25566};
    config.backlog = 5;
    config.buffer_size = 4096;
    config.allow_list_path = "allowed_ips.json";
    config.log = {"logs", "proxy.log"};
    return config;
}

AppConfig load_config(const std::string& config_path, std::ostream& log) {
    if (config_path.empty()) {
        log << "[config] No config path provided. Using defaults.\n";
        return make_default_config();
    }

    std::ifstream in(config_path);
    if (!in) {
        log << "[config] Cannot open config file at " << config_path << ". Using defaults.\n";
        return make_default_config();
    }

    pt::ptree tree;
    try {
        pt::read_json(in, tree);
    } catch (const std::exception& ex) {
        log << "[config] Failed to parse JSON: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    AppConfig config = make_default_config();
    try {
        config.listener.address = tree.get<std::string>("listen.address", config.listener.address);
        config.listener.port = tree.get<uint16_t>("listen.port", config.listener.port);
        if (auto backend_node = tree.get_child_optional("backend")) {
            config.backend = parse_backend(*backend_node, config.backend);
        }
        config.backlog = tree.get<int>("backlog", config.backlog);
        config.buffer_size = tree.get<std::size_t>("buffer_size", config.buffer_size);
        config.allow_list_path = tree.get<std::string>("allow_list", config.allow_list_path);
        config.log.directory = tree.get<std::string>("log.directory", config.log.directory);
        config.log.file = tree.get<std::string>("log.file", config.log.file);
    } catch (const pt::ptree_error& ex) {
        log << "[config] Invalid value: " << ex.what() << ". Using defaults.\n";
        return make_default_config();
    }

    config.buffer_size = std::max(kMinBuffer, std::min(config.buffer_size, kMaxBuffer));
    if (config.backlog <= 0) {
        log << "[config] Non-positive backlog, using 5.\n";
        config.backlog = 5;
    }
    if (config.backend.port == 0) {
        log << "[config] Backend port 0 is invalid, using " << make_default_config().backend.port << ".\n";
        config.backend.port = make_default_config().backend.port;
    }
    if (config.log.file.empty()) {
        config.log.file = make_default_config().log.file;
    }

    return config;
}

} // namespace relay_guard
