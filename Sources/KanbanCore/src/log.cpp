#include "kanban/log.hpp"

namespace kanban {

std::atomic<log_level> g_log_level{log_level::off};

bool parse_log_level(const std::string& name, log_level& out) {
    if (name == "off") { out = log_level::off; return true; }
    if (name == "error") { out = log_level::error; return true; }
    if (name == "warn") { out = log_level::warn; return true; }
    if (name == "info") { out = log_level::info; return true; }
    if (name == "debug") { out = log_level::debug; return true; }
    return false;
}

const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

}  // namespace kanban
