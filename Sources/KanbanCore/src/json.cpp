#include "kanban/json.hpp"
#include "kanban/errors.hpp"

namespace kanban {

void to_json(nlohmann::json& j, item_status status) {
    j = to_string(status);
}

void from_json(const nlohmann::json& j, item_status& status) {
    auto parsed = parse_status(j.get<std::string>());
    if (!parsed) {
        throw validation_error("Unknown status '" + j.get<std::string>() + "'");
    }
    status = *parsed;
}

void to_json(nlohmann::json& j, const backlog_item& item) {
    j = nlohmann::json::object();
    j["id"] = item.id;
    j["globalId"] = item.global_id;
    j["project_id"] = item.project_id;
    put_optional(j, "parent_id", item.parent_id);
    j["type"] = item.type;
    j["title"] = item.title;
    put_optional(j, "description", item.description);
    j["status"] = item.status;
    j["rank"] = item.rank;
    put_optional(j, "reviewer_id", item.reviewer_id);
    put_optional(j, "assignee_id", item.assignee_id);
    put_optional(j, "estimate_value", item.estimate_value);
    put_optional(j, "story_point", item.story_point);
    j["pause"] = item.pause;
    put_optional(j, "deadline", item.deadline);
    put_optional(j, "started_at", item.started_at);
    put_optional(j, "completed_at", item.completed_at);
    j["created_at"] = item.created_at;
    j["updated_at"] = item.updated_at;
    j["version"] = item.version;
}

void to_json(nlohmann::json& j, const wip_limit& limit) {
    j = nlohmann::json::object();
    j["project_id"] = limit.project_id;
    j["column"] = limit.column;
    put_optional(j, "limit", limit.limit);
    j["limit_type"] = to_string(limit.type);
    j["updated_at"] = limit.updated_at;
}

void to_json(nlohmann::json& j, const wip_usage& usage) {
    j = nlohmann::json::object();
    j["column"] = usage.column;
    put_optional(j, "limit", usage.limit);
    j["limit_type"] = to_string(usage.type);
    j["load"] = usage.load;
    put_optional(j, "available", usage.available);
}

void to_json(nlohmann::json& j, const admission& result) {
    j = nlohmann::json::object();
    j["column"] = result.column;
    j["load_before"] = result.load_before;
    j["incoming_weight"] = result.incoming_weight;
    put_optional(j, "limit", result.limit);
    j["soft_overrun"] = result.soft_overrun;
}

void to_json(nlohmann::json& j, const status_change& change) {
    j = nlohmann::json::object();
    j["id"] = change.id;
    j["item_id"] = change.item_id;
    j["project_id"] = change.project_id;
    put_optional(j, "from", change.from);
    j["to"] = change.to;
    put_optional(j, "actor_id", change.actor_id);
    j["changed_at"] = change.changed_at;
}

void to_json(nlohmann::json& j, const activity_entry& entry) {
    j = nlohmann::json::object();
    j["id"] = entry.id;
    j["item_id"] = entry.item_id;
    j["project_id"] = entry.project_id;
    j["kind"] = entry.kind;
    j["changes"] = entry.changes.empty() ? nlohmann::json::object() : nlohmann::json::parse(entry.changes);
    put_optional(j, "actor_id", entry.actor_id);
    j["created_at"] = entry.created_at;
}

void to_json(nlohmann::json& j, const flow_summary& summary) {
    j = nlohmann::json::object();
    put_optional(j, "avg_cycle_time_hours", summary.avg_cycle_time_hours);
    put_optional(j, "avg_lead_time_hours", summary.avg_lead_time_hours);
    j["throughput_per_week"] = summary.throughput_per_week;
    j["total_completed"] = summary.total_completed;
    j["work_in_progress"] = summary.work_in_progress;
}

void to_json(nlohmann::json& j, const board_node& node) {
    to_json(j, node.item);
    j["children"] = node.children;
}

void to_json(nlohmann::json& j, const board_column& column) {
    j = nlohmann::json::object();
    j["status"] = column.status;
    put_optional(j, "wip_limit", column.limit);
    j["load"] = column.load;
    j["items"] = column.items;
}

void to_json(nlohmann::json& j, const kanban_board& board) {
    j = nlohmann::json::object();
    j["project_id"] = board.project_id;
    j["generated_at"] = board.generated_at;
    j["columns"] = nlohmann::json::array();
    for (const auto& column : board.columns) {
        j["columns"].push_back(column);
    }
}

} // namespace kanban
