#pragma once

#include "types.hpp"
#include <vector>

namespace kanban {

class database;

namespace tables {
    inline constexpr const char* project = "KanbanProject";
    inline constexpr const char* item = "BacklogItem";
    inline constexpr const char* wip_limit = "WIPLimit";
    inline constexpr const char* status_history = "StatusHistory";
    inline constexpr const char* activity = "ItemActivity";
} // namespace tables

/// Version written to PRAGMA user_version once the tables below exist.
inline constexpr int schema_version = 1;

/// Logical layout: BacklogItem keyed by id with secondary indexes on
/// (project_id, status, rank) and (project_id, parent_id); WIPLimit keyed by
/// (project_id, board_column).
std::vector<table_schema> kanban_schema();

/// Creates missing tables and indexes. Throws store_error if the file was
/// written by a newer schema.
void ensure_schema(database& db);

} // namespace kanban
