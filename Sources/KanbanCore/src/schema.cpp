#include "kanban/schema.hpp"
#include "kanban/db.hpp"
#include "kanban/log.hpp"

namespace kanban {

std::vector<table_schema> kanban_schema() {
    std::vector<table_schema> schemas;

    table_schema project;
    project.name = tables::project;
    project.autoincrement_id = false;
    project.columns = {
        {"project_id", column_type::text},
        {"weighting", column_type::text, false, "'count'"},
        {"created_at", column_type::real},
    };
    project.primary_key = {"project_id"};
    schemas.push_back(std::move(project));

    table_schema item;
    item.name = tables::item;
    item.columns = {
        {"globalId", column_type::text},
        {"project_id", column_type::text},
        {"parent_id", column_type::integer, true},
        {"type", column_type::text},
        {"title", column_type::text},
        {"description", column_type::text, true},
        {"status", column_type::integer},
        {"rank", column_type::text},
        {"reviewer_id", column_type::text, true},
        {"assignee_id", column_type::text, true},
        {"estimate_value", column_type::integer, true},
        {"story_point", column_type::integer, true},
        {"pause", column_type::integer, false, "0"},
        {"deadline", column_type::real, true},
        {"started_at", column_type::real, true},
        {"completed_at", column_type::real, true},
        {"created_at", column_type::real},
        {"updated_at", column_type::real},
        {"version", column_type::integer, false, "1"},
    };
    item.indexes = {
        {"idx_item_global_id", {"globalId"}, true},
        {"idx_item_column_rank", {"project_id", "status", "rank"}, true},
        {"idx_item_parent", {"project_id", "parent_id"}, false},
    };
    schemas.push_back(std::move(item));

    table_schema wip;
    wip.name = tables::wip_limit;
    wip.autoincrement_id = false;
    wip.columns = {
        {"project_id", column_type::text},
        {"board_column", column_type::integer},
        {"wip_limit", column_type::integer, true},
        {"limit_type", column_type::text, false, "'hard'"},
        {"updated_at", column_type::real},
    };
    wip.primary_key = {"project_id", "board_column"};
    schemas.push_back(std::move(wip));

    table_schema history;
    history.name = tables::status_history;
    history.columns = {
        {"item_id", column_type::integer},
        {"project_id", column_type::text},
        {"from_status", column_type::integer, true},
        {"to_status", column_type::integer},
        {"actor_id", column_type::text, true},
        {"changed_at", column_type::real},
    };
    history.indexes = {
        {"idx_history_item", {"item_id"}, false},
        {"idx_history_project", {"project_id", "to_status"}, false},
    };
    schemas.push_back(std::move(history));

    table_schema activity;
    activity.name = tables::activity;
    activity.columns = {
        {"item_id", column_type::integer},
        {"project_id", column_type::text},
        {"kind", column_type::text},
        {"changes", column_type::text},
        {"actor_id", column_type::text, true},
        {"created_at", column_type::real},
    };
    activity.indexes = {
        {"idx_activity_item", {"item_id"}, false},
    };
    schemas.push_back(std::move(activity));

    return schemas;
}

void ensure_schema(database& db) {
    int on_disk = db.user_version();
    if (on_disk > schema_version) {
        LOG_ERROR("schema", "Database %s is at schema %d, this build understands %d",
                  db.path().c_str(), on_disk, schema_version);
        throw store_error("Database schema version " + std::to_string(on_disk) +
                          " is newer than supported version " + std::to_string(schema_version));
    }

    transaction tx(db, true);
    for (const auto& schema : kanban_schema()) {
        db.ensure_table(schema);
    }
    if (on_disk < schema_version) {
        db.set_user_version(schema_version);
        LOG_INFO("schema", "Schema initialized at version %d", schema_version);
    }
    tx.commit();
}

} // namespace kanban
