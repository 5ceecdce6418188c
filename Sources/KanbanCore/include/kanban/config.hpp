#pragma once

#include "log.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace kanban {

struct configuration {
    /// Database file path. Use ":memory:" for an in-memory store.
    std::string path = ":memory:";

    /// How long a writer waits on another connection's lock before failing.
    int busy_timeout_ms = 5000;

    /// Children attached to each board card: nullopt = full subtree,
    /// 1 = direct children only, 0 = none.
    std::optional<size_t> board_child_depth;

    /// Longest rank key the sequencer will hand out before rebalancing the column.
    size_t rank_max_length = 12;

    /// Upper bound on ancestor walks; a longer chain is treated as corrupt.
    size_t max_hierarchy_depth = 4096;

    log_level level = log_level::off;

    configuration() = default;

    explicit configuration(const std::string& p) : path(p) {}

    /// Reads the fields above from a JSON object. Unknown keys are ignored.
    static configuration from_json(const nlohmann::json& j);
};

/// Loads a configuration from a JSON file.
configuration load_configuration(const std::string& file_path);

}  // namespace kanban
