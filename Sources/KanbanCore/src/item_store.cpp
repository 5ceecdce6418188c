#include "kanban/item_store.hpp"
#include "kanban/log.hpp"
#include "kanban/schema.hpp"
#include <sstream>

namespace kanban {

namespace {

void check_size(const char* field, const std::optional<int64_t>& value) {
    if (value && *value < 0) {
        throw validation_error(std::string(field) + " must not be negative");
    }
    if (value && *value > max_item_size) {
        throw validation_error(std::string(field) + " must not exceed " + std::to_string(max_item_size));
    }
}

timestamp_t next_updated_at(timestamp_t previous) {
    return std::max(now_ms(), previous);
}

} // namespace

item_store::item_store(const configuration& config)
    : config_(config)
    , db_(config.path, config.busy_timeout_ms) {
    ensure_schema(db_);
    LOG_DEBUG("store", "Opened item store at %s", config_.path.c_str());
}

// ============================================================================
// Row mapping
// ============================================================================

backlog_item item_store::item_from_row(const database::row_t& row) {
    backlog_item item;
    item.id = detail::get<int64_t>(row, "id");
    item.global_id = detail::get<std::string>(row, "globalId");
    item.project_id = detail::get<std::string>(row, "project_id");
    item.parent_id = detail::get_optional<int64_t>(row, "parent_id");
    item.type = detail::get<std::string>(row, "type");
    item.title = detail::get<std::string>(row, "title");
    item.description = detail::get_optional<std::string>(row, "description");
    item.status = static_cast<item_status>(detail::get<int>(row, "status"));
    item.rank = detail::get<std::string>(row, "rank");
    item.reviewer_id = detail::get_optional<std::string>(row, "reviewer_id");
    item.assignee_id = detail::get_optional<std::string>(row, "assignee_id");
    item.estimate_value = detail::get_optional<int64_t>(row, "estimate_value");
    item.story_point = detail::get_optional<int64_t>(row, "story_point");
    item.pause = detail::get<bool>(row, "pause");
    item.deadline = detail::get_optional<timestamp_t>(row, "deadline");
    item.started_at = detail::get_optional<timestamp_t>(row, "started_at");
    item.completed_at = detail::get_optional<timestamp_t>(row, "completed_at");
    item.created_at = detail::get<timestamp_t>(row, "created_at");
    item.updated_at = detail::get<timestamp_t>(row, "updated_at");
    item.version = detail::get<int64_t>(row, "version");
    return item;
}

wip_limit item_store::limit_from_row(const database::row_t& row) {
    wip_limit limit;
    limit.project_id = detail::get<std::string>(row, "project_id");
    limit.column = static_cast<item_status>(detail::get<int>(row, "board_column"));
    limit.limit = detail::get_optional<int64_t>(row, "wip_limit");
    limit.type = parse_limit_type(detail::get<std::string>(row, "limit_type")).value_or(limit_type::hard);
    limit.updated_at = detail::get<timestamp_t>(row, "updated_at");
    return limit;
}

project_record item_store::project_from_row(const database::row_t& row) {
    project_record project;
    project.id = detail::get<std::string>(row, "project_id");
    project.weighting = parse_weighting(detail::get<std::string>(row, "weighting")).value_or(wip_weighting::count);
    project.created_at = detail::get<timestamp_t>(row, "created_at");
    return project;
}

// ============================================================================
// Projects
// ============================================================================

project_record item_store::register_project(const project_id_t& project_id, wip_weighting weighting) {
    if (project_id.empty()) {
        throw validation_error("project_id is required");
    }
    return write([&] {
        if (auto existing = find_project(project_id)) {
            return *existing;
        }

        auto now = now_ms();
        db_.insert(tables::project, {
            {"project_id", project_id},
            {"weighting", std::string(to_string(weighting))},
            {"created_at", detail::to_column_value(now)},
        });
        for (auto column : {item_status::todo, item_status::doing}) {
            db_.insert(tables::wip_limit, {
                {"project_id", project_id},
                {"board_column", detail::to_column_value(static_cast<int>(column))},
                {"wip_limit", nullptr},
                {"limit_type", std::string(to_string(limit_type::hard))},
                {"updated_at", detail::to_column_value(now)},
            });
        }
        LOG_INFO("store", "Registered project '%s' (%s weighting)", project_id.c_str(), to_string(weighting));
        return project_record{project_id, weighting, now};
    });
}

std::optional<project_record> item_store::find_project(const project_id_t& project_id) const {
    return read([&]() -> std::optional<project_record> {
        auto rows = db_.query("SELECT * FROM " + std::string(tables::project) + " WHERE project_id = ?",
                              {project_id});
        if (rows.empty()) return std::nullopt;
        return project_from_row(rows[0]);
    });
}

project_record item_store::require_project(const project_id_t& project_id) const {
    auto project = find_project(project_id);
    if (!project) {
        throw not_found_error("Project '" + project_id + "' not found");
    }
    return *project;
}

project_record item_store::set_weighting(const project_id_t& project_id, wip_weighting weighting) {
    return write([&] {
        auto project = require_project(project_id);
        db_.update_where(tables::project, {{"weighting", std::string(to_string(weighting))}},
                         "project_id = ?", {project_id});
        project.weighting = weighting;
        return project;
    });
}

// ============================================================================
// Items
// ============================================================================

backlog_item item_store::create(const new_item& item, const std::string& rank) {
    if (item.project_id.empty()) {
        throw validation_error("project_id is required");
    }
    if (item.title.empty()) {
        throw validation_error("title is required");
    }
    if (item.type.empty()) {
        throw validation_error("type is required");
    }
    if (item.status && *item.status != item_status::backlog) {
        throw validation_error(std::string("Items are created in Backlog, not ") + to_string(*item.status));
    }
    check_size("estimate_value", item.estimate_value);
    check_size("story_point", item.story_point);

    return write([&] {
        require_project(item.project_id);
        if (item.parent_id) {
            auto parent = find(*item.parent_id);
            if (!parent) {
                throw not_found_error("Parent item " + std::to_string(*item.parent_id) + " not found");
            }
            if (parent->project_id != item.project_id) {
                throw cross_project_error(0, item.project_id, parent->project_id);
            }
        }

        auto now = now_ms();
        auto id = db_.insert(tables::item, {
            {"globalId", make_global_id()},
            {"project_id", item.project_id},
            {"parent_id", detail::to_column_value(item.parent_id)},
            {"type", item.type},
            {"title", item.title},
            {"description", detail::to_column_value(item.description)},
            {"status", detail::to_column_value(static_cast<int>(item_status::backlog))},
            {"rank", rank},
            {"reviewer_id", detail::to_column_value(item.reviewer_id)},
            {"assignee_id", detail::to_column_value(item.assignee_id)},
            {"estimate_value", detail::to_column_value(item.estimate_value)},
            {"story_point", detail::to_column_value(item.story_point)},
            {"pause", detail::to_column_value(false)},
            {"deadline", detail::to_column_value(item.deadline)},
            {"created_at", detail::to_column_value(now)},
            {"updated_at", detail::to_column_value(now)},
            {"version", detail::to_column_value(int64_t{1})},
        });
        LOG_DEBUG("store", "Created item %lld in project '%s'", static_cast<long long>(id), item.project_id.c_str());
        return get(id);
    });
}

std::optional<backlog_item> item_store::find(item_id_t id) const {
    return read([&]() -> std::optional<backlog_item> {
        auto rows = db_.query("SELECT * FROM " + std::string(tables::item) + " WHERE id = ?", {id});
        if (rows.empty()) return std::nullopt;
        return item_from_row(rows[0]);
    });
}

backlog_item item_store::get(item_id_t id) const {
    auto item = find(id);
    if (!item) {
        throw not_found_error("Item " + std::to_string(id) + " not found");
    }
    return *item;
}

backlog_item item_store::update(item_id_t id, const item_patch& patch) {
    if (!patch.expected_version) {
        throw validation_error("expected_version is required to update item " + std::to_string(id));
    }
    if (patch.title && patch.title->empty()) {
        throw validation_error("title must not be empty");
    }
    if (patch.type && patch.type->empty()) {
        throw validation_error("type must not be empty");
    }
    check_size("estimate_value", patch.estimate_value.value);
    check_size("story_point", patch.story_point.value);

    return write([&] {
        auto current = get(id);
        if (current.version != *patch.expected_version) {
            LOG_INFO("store", "Rejected stale patch for item %lld (expected v%lld, at v%lld)",
                     static_cast<long long>(id), static_cast<long long>(*patch.expected_version),
                     static_cast<long long>(current.version));
            throw conflict_error(id, *patch.expected_version, current.version);
        }

        std::vector<std::pair<std::string, column_value_t>> values;
        if (patch.title) values.emplace_back("title", *patch.title);
        if (patch.type) values.emplace_back("type", *patch.type);
        if (patch.description.present) values.emplace_back("description", detail::to_column_value(patch.description.value));
        if (patch.reviewer_id.present) values.emplace_back("reviewer_id", detail::to_column_value(patch.reviewer_id.value));
        if (patch.assignee_id.present) values.emplace_back("assignee_id", detail::to_column_value(patch.assignee_id.value));
        if (patch.estimate_value.present) values.emplace_back("estimate_value", detail::to_column_value(patch.estimate_value.value));
        if (patch.story_point.present) values.emplace_back("story_point", detail::to_column_value(patch.story_point.value));
        if (patch.deadline.present) values.emplace_back("deadline", detail::to_column_value(patch.deadline.value));
        if (values.empty()) {
            return current;
        }

        values.emplace_back("updated_at", detail::to_column_value(next_updated_at(current.updated_at)));
        values.emplace_back("version", detail::to_column_value(current.version + 1));
        int changed = db_.update_where(tables::item, values, "id = ? AND version = ?",
                                       {id, current.version});
        if (changed == 0) {
            throw conflict_error(id, *patch.expected_version, get(id).version);
        }
        return get(id);
    });
}

void item_store::remove(item_id_t id) {
    write([&] {
        get(id);
        auto children = count_children(id);
        if (children > 0) {
            throw has_children_error(id, children);
        }
        db_.execute("DELETE FROM " + std::string(tables::item) + " WHERE id = ?", {id});
        LOG_DEBUG("store", "Deleted item %lld", static_cast<long long>(id));
    });
}

std::vector<backlog_item> item_store::list_by_project(const project_id_t& project_id,
                                                      const item_filter& filter) const {
    std::ostringstream sql;
    std::vector<column_value_t> params{project_id};
    sql << "SELECT * FROM " << tables::item << " WHERE project_id = ?";
    if (filter.status) {
        sql << " AND status = ?";
        params.push_back(detail::to_column_value(static_cast<int>(*filter.status)));
    }
    if (filter.assignee_id) {
        sql << " AND assignee_id = ?";
        params.push_back(*filter.assignee_id);
    }
    if (filter.type) {
        sql << " AND type = ?";
        params.push_back(*filter.type);
    }
    if (filter.parent_id) {
        sql << " AND parent_id = ?";
        params.push_back(*filter.parent_id);
    } else if (filter.roots_only) {
        sql << " AND parent_id IS NULL";
    }
    sql << " ORDER BY status, rank";
    if (filter.limit > 0 || filter.offset > 0) {
        sql << " LIMIT " << (filter.limit > 0 ? static_cast<int64_t>(filter.limit) : -1)
            << " OFFSET " << filter.offset;
    }

    return read([&] {
        std::vector<backlog_item> items;
        for (const auto& row : db_.query(sql.str(), params)) {
            items.push_back(item_from_row(row));
        }
        return items;
    });
}

std::vector<backlog_item> item_store::column_items(const project_id_t& project_id, item_status status) const {
    item_filter filter;
    filter.status = status;
    return list_by_project(project_id, filter);
}

std::vector<backlog_item> item_store::children_of(item_id_t id) const {
    return read([&] {
        std::vector<backlog_item> items;
        auto rows = db_.query("SELECT * FROM " + std::string(tables::item) +
                              " WHERE parent_id = ? ORDER BY status, rank", {id});
        for (const auto& row : rows) {
            items.push_back(item_from_row(row));
        }
        return items;
    });
}

size_t item_store::count_children(item_id_t id) const {
    return read([&] {
        auto rows = db_.query("SELECT COUNT(*) AS n FROM " + std::string(tables::item) +
                              " WHERE parent_id = ?", {id});
        return static_cast<size_t>(detail::get<int64_t>(rows[0], "n"));
    });
}

backlog_item item_store::set_fields(item_id_t id, std::vector<std::pair<std::string, column_value_t>> values) {
    return write([&] {
        auto current = get(id);
        values.emplace_back("updated_at", detail::to_column_value(next_updated_at(current.updated_at)));
        values.emplace_back("version", detail::to_column_value(current.version + 1));
        db_.update_where(tables::item, values, "id = ?", {id});
        return get(id);
    });
}

void item_store::rewrite_ranks(const project_id_t& project_id, item_status status,
                               const std::vector<std::pair<item_id_t, std::string>>& ranks) {
    write([&] {
        // updated_at never moves backwards, same as next_updated_at
        db_.execute("UPDATE " + std::string(tables::item) +
                    " SET rank = '~' || id, updated_at = MAX(updated_at, ?) WHERE project_id = ? AND status = ?",
                    {detail::to_column_value(now_ms()), project_id,
                     detail::to_column_value(static_cast<int>(status))});
        for (const auto& [id, rank] : ranks) {
            db_.update_where(tables::item, {{"rank", rank}}, "id = ?", {id});
        }
    });
}

// ============================================================================
// WIP limits
// ============================================================================

std::optional<wip_limit> item_store::find_wip_limit(const project_id_t& project_id, item_status column) const {
    return read([&]() -> std::optional<wip_limit> {
        auto rows = db_.query("SELECT * FROM " + std::string(tables::wip_limit) +
                              " WHERE project_id = ? AND board_column = ?",
                              {project_id, detail::to_column_value(static_cast<int>(column))});
        if (rows.empty()) return std::nullopt;
        return limit_from_row(rows[0]);
    });
}

wip_limit item_store::put_wip_limit(const wip_limit& limit) {
    return write([&] {
        auto stored = limit;
        stored.updated_at = now_ms();
        db_.execute("INSERT OR REPLACE INTO " + std::string(tables::wip_limit) +
                    " (project_id, board_column, wip_limit, limit_type, updated_at) VALUES (?, ?, ?, ?, ?)",
                    {stored.project_id,
                     detail::to_column_value(static_cast<int>(stored.column)),
                     detail::to_column_value(stored.limit),
                     std::string(to_string(stored.type)),
                     detail::to_column_value(stored.updated_at)});
        return stored;
    });
}

std::vector<wip_limit> item_store::wip_limits(const project_id_t& project_id) const {
    return read([&] {
        std::vector<wip_limit> limits;
        auto rows = db_.query("SELECT * FROM " + std::string(tables::wip_limit) +
                              " WHERE project_id = ? ORDER BY board_column", {project_id});
        for (const auto& row : rows) {
            limits.push_back(limit_from_row(row));
        }
        return limits;
    });
}

// ============================================================================
// History
// ============================================================================

void item_store::append_status_change(const backlog_item& item, std::optional<item_status> from,
                                      const std::optional<user_id_t>& actor_id) {
    write([&] {
        std::optional<int> from_value;
        if (from) from_value = static_cast<int>(*from);
        db_.insert(tables::status_history, {
            {"item_id", item.id},
            {"project_id", item.project_id},
            {"from_status", detail::to_column_value(from_value)},
            {"to_status", detail::to_column_value(static_cast<int>(item.status))},
            {"actor_id", detail::to_column_value(actor_id)},
            {"changed_at", detail::to_column_value(item.updated_at)},
        });
    });
}

void item_store::append_activity(const backlog_item& item, const std::string& kind,
                                 const std::string& changes, const std::optional<user_id_t>& actor_id) {
    write([&] {
        db_.insert(tables::activity, {
            {"item_id", item.id},
            {"project_id", item.project_id},
            {"kind", kind},
            {"changes", changes},
            {"actor_id", detail::to_column_value(actor_id)},
            {"created_at", detail::to_column_value(now_ms())},
        });
    });
}

std::vector<status_change> item_store::status_history(item_id_t id) const {
    return read([&] {
        std::vector<status_change> changes;
        auto rows = db_.query("SELECT * FROM " + std::string(tables::status_history) +
                              " WHERE item_id = ? ORDER BY id", {id});
        for (const auto& row : rows) {
            status_change change;
            change.id = detail::get<int64_t>(row, "id");
            change.item_id = detail::get<int64_t>(row, "item_id");
            change.project_id = detail::get<std::string>(row, "project_id");
            if (auto from = detail::get_optional<int>(row, "from_status")) {
                change.from = static_cast<item_status>(*from);
            }
            change.to = static_cast<item_status>(detail::get<int>(row, "to_status"));
            change.actor_id = detail::get_optional<std::string>(row, "actor_id");
            change.changed_at = detail::get<timestamp_t>(row, "changed_at");
            changes.push_back(std::move(change));
        }
        return changes;
    });
}

std::vector<activity_entry> item_store::activity(item_id_t id) const {
    return read([&] {
        std::vector<activity_entry> entries;
        auto rows = db_.query("SELECT * FROM " + std::string(tables::activity) +
                              " WHERE item_id = ? ORDER BY id", {id});
        for (const auto& row : rows) {
            activity_entry entry;
            entry.id = detail::get<int64_t>(row, "id");
            entry.item_id = detail::get<int64_t>(row, "item_id");
            entry.project_id = detail::get<std::string>(row, "project_id");
            entry.kind = detail::get<std::string>(row, "kind");
            entry.changes = detail::get<std::string>(row, "changes");
            entry.actor_id = detail::get_optional<std::string>(row, "actor_id");
            entry.created_at = detail::get<timestamp_t>(row, "created_at");
            entries.push_back(std::move(entry));
        }
        return entries;
    });
}

} // namespace kanban
