#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace kanban {

// ============================================================================
// Workflow columns
// ============================================================================

enum class item_status : int {
    backlog = 0,
    todo = 1,
    doing = 2,
    done = 3
};

inline constexpr std::array<item_status, 4> all_statuses = {
    item_status::backlog, item_status::todo, item_status::doing, item_status::done
};

/// Board label: "Backlog", "Todo", "Doing", "Done".
const char* to_string(item_status status);

/// Accepts the board labels case-insensitively. Returns nullopt for anything else.
std::optional<item_status> parse_status(const std::string& text);

/// Only Todo and Doing carry a WIP limit; Backlog and Done are unbounded.
inline bool is_bounded_column(item_status status) {
    return status == item_status::todo || status == item_status::doing;
}

// ============================================================================
// Projects and WIP policy
// ============================================================================

/// Largest accepted estimate_value or story_point. Keeps summed column
/// loads far from int64 overflow.
inline constexpr int64_t max_item_size = 1'000'000;

enum class wip_weighting {
    count,   // every item weighs 1
    points   // story_point, else estimate_value, else 1
};

const char* to_string(wip_weighting weighting);
std::optional<wip_weighting> parse_weighting(const std::string& text);

enum class limit_type {
    hard,  // denies admission
    soft   // admits and reports the overrun
};

const char* to_string(limit_type type);
std::optional<limit_type> parse_limit_type(const std::string& text);

struct project_record {
    project_id_t id;
    wip_weighting weighting = wip_weighting::count;
    timestamp_t created_at{};
};

struct wip_limit {
    project_id_t project_id;
    item_status column = item_status::todo;
    std::optional<int64_t> limit;  // nullopt = unlimited
    limit_type type = limit_type::hard;
    timestamp_t updated_at{};

    bool is_unlimited() const { return !limit.has_value(); }
};

struct wip_usage {
    item_status column = item_status::todo;
    std::optional<int64_t> limit;
    limit_type type = limit_type::hard;
    int64_t load = 0;
    std::optional<int64_t> available;  // nullopt when unlimited
};

/// Result of a successful admission check.
struct admission {
    item_status column = item_status::todo;
    int64_t load_before = 0;
    int64_t incoming_weight = 0;
    std::optional<int64_t> limit;
    bool soft_overrun = false;
};

/// Caller identity and abort signal for a mutating operation.
struct operation_context {
    std::optional<user_id_t> actor_id;
    std::stop_token stop;
};

// ============================================================================
// Backlog items
// ============================================================================

struct backlog_item {
    item_id_t id = 0;
    std::string global_id;
    project_id_t project_id;
    std::optional<item_id_t> parent_id;
    std::string type;
    std::string title;
    std::optional<std::string> description;
    item_status status = item_status::backlog;
    std::string rank;
    std::optional<user_id_t> reviewer_id;
    std::optional<user_id_t> assignee_id;
    std::optional<int64_t> estimate_value;
    std::optional<int64_t> story_point;
    bool pause = false;
    std::optional<timestamp_t> deadline;
    std::optional<timestamp_t> started_at;
    std::optional<timestamp_t> completed_at;
    timestamp_t created_at{};
    timestamp_t updated_at{};
    int64_t version = 0;
};

/// Creation request. Items always start in Backlog.
struct new_item {
    project_id_t project_id;
    std::string title;
    std::string type = "task";
    std::optional<std::string> description;
    std::optional<item_id_t> parent_id;
    std::optional<user_id_t> reviewer_id;
    std::optional<user_id_t> assignee_id;
    std::optional<int64_t> estimate_value;
    std::optional<int64_t> story_point;
    std::optional<timestamp_t> deadline;
    std::optional<item_status> status;  // if set, must be Backlog
};

/// Optional field that can also be explicitly cleared.
template<typename T>
struct field_update {
    bool present = false;
    std::optional<T> value;

    field_update() = default;
    field_update(T v) : present(true), value(std::move(v)) {}
    field_update(std::nullopt_t) : present(true), value(std::nullopt) {}
};

/// Content patch. Status, rank, parent and pause are deliberately absent:
/// each has its own operation with its own checks.
struct item_patch {
    std::optional<int64_t> expected_version;  // required
    std::optional<std::string> title;
    std::optional<std::string> type;
    field_update<std::string> description;
    field_update<user_id_t> reviewer_id;
    field_update<user_id_t> assignee_id;
    field_update<int64_t> estimate_value;
    field_update<int64_t> story_point;
    field_update<timestamp_t> deadline;

    bool touches_weight() const { return estimate_value.present || story_point.present; }
};

struct item_filter {
    std::optional<item_status> status;
    std::optional<user_id_t> assignee_id;
    std::optional<std::string> type;
    std::optional<item_id_t> parent_id;
    bool roots_only = false;
    size_t limit = 0;   // 0 = no limit
    size_t offset = 0;
};

enum class delete_policy {
    detach_children,  // children become roots
    cascade_delete    // whole subtree removed, leaves first
};

// ============================================================================
// History
// ============================================================================

struct status_change {
    int64_t id = 0;
    item_id_t item_id = 0;
    project_id_t project_id;
    std::optional<item_status> from;  // nullopt for creation
    item_status to = item_status::backlog;
    std::optional<user_id_t> actor_id;
    timestamp_t changed_at{};
};

struct activity_entry {
    int64_t id = 0;
    item_id_t item_id = 0;
    project_id_t project_id;
    std::string kind;     // create, update, transition, reorder, reparent, pause, delete
    std::string changes;  // JSON object {field: {"from": .., "to": ..}}
    std::optional<user_id_t> actor_id;
    timestamp_t created_at{};
};

struct cycle_time_record {
    item_id_t item_id = 0;
    timestamp_t started_at{};
    timestamp_t completed_at{};
    double hours = 0.0;
};

struct flow_summary {
    std::optional<double> avg_cycle_time_hours;
    std::optional<double> avg_lead_time_hours;
    int64_t throughput_per_week = 0;
    int64_t total_completed = 0;
    int64_t work_in_progress = 0;
};

// ============================================================================
// Board projection
// ============================================================================

struct board_node {
    backlog_item item;
    std::vector<board_node> children;
};

struct board_column {
    item_status status = item_status::backlog;
    std::optional<int64_t> limit;
    int64_t load = 0;
    std::vector<board_node> items;
};

struct kanban_board {
    project_id_t project_id;
    std::array<board_column, 4> columns;
    timestamp_t generated_at{};

    const board_column& column(item_status status) const {
        return columns[static_cast<size_t>(status)];
    }
};

} // namespace kanban
