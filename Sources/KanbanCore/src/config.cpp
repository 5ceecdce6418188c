#include "kanban/config.hpp"
#include "kanban/errors.hpp"
#include <fstream>

namespace kanban {

namespace {

template<typename T>
T read_field(const nlohmann::json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw validation_error(std::string("Invalid configuration value for '") + key + "': " + e.what());
    }
}

} // namespace

configuration configuration::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw validation_error("Configuration must be a JSON object");
    }

    configuration config;
    config.path = read_field<std::string>(j, "path", config.path);
    config.busy_timeout_ms = read_field<int>(j, "busy_timeout_ms", config.busy_timeout_ms);
    config.rank_max_length = read_field<size_t>(j, "rank_max_length", config.rank_max_length);
    config.max_hierarchy_depth = read_field<size_t>(j, "max_hierarchy_depth", config.max_hierarchy_depth);

    auto depth = j.find("board_child_depth");
    if (depth != j.end() && !depth->is_null()) {
        if (!depth->is_number_integer() || depth->get<int64_t>() < 0) {
            throw validation_error("Invalid configuration value for 'board_child_depth'");
        }
        config.board_child_depth = depth->get<size_t>();
    }

    auto level_name = read_field<std::string>(j, "log_level", to_string(config.level));
    if (!parse_log_level(level_name, config.level)) {
        throw validation_error("Unknown log level '" + level_name + "'");
    }

    if (config.rank_max_length < 4) {
        throw validation_error("rank_max_length must be at least 4");
    }
    if (config.busy_timeout_ms < 0) {
        throw validation_error("busy_timeout_ms must not be negative");
    }
    return config;
}

configuration load_configuration(const std::string& file_path) {
    std::ifstream in(file_path);
    if (!in) {
        throw not_found_error("Configuration file not found: " + file_path);
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw validation_error("Malformed configuration file " + file_path + ": " + e.what());
    }
    return configuration::from_json(j);
}

} // namespace kanban
