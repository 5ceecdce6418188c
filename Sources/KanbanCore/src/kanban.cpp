#include "kanban/kanban.hpp"
#include "kanban/json.hpp"
#include "kanban/log.hpp"
#include "kanban/metrics.hpp"

namespace kanban {

kanban_db::kanban_db(const configuration& config)
    : config_(config)
    , store_(config_)
    , wip_(store_, locks_)
    , ranks_(store_, locks_, config_.rank_max_length)
    , workflow_(store_, locks_, wip_, ranks_)
    , hierarchy_(store_, locks_, config_.max_hierarchy_depth)
    , board_(store_, config_.board_child_depth) {
    set_log_level(config_.level);
    LOG_INFO("kanban", "Opened board store at %s", config_.path.c_str());
}

project_record kanban_db::register_project(const project_id_t& project_id, wip_weighting weighting) {
    return store_.register_project(project_id, weighting);
}

project_record kanban_db::set_wip_weighting(const project_id_t& project_id, wip_weighting weighting) {
    // Weighting feeds every admission in the project
    std::vector<partition_key> keys;
    for (auto status : all_statuses) {
        keys.push_back(partition_key::column(project_id, status));
    }
    auto guard = locks_.acquire(std::move(keys));
    return store_.set_weighting(project_id, weighting);
}

// ============================================================================
// Items
// ============================================================================

backlog_item kanban_db::create_item(const new_item& item, const operation_context& ctx) {
    std::vector<partition_key> keys{partition_key::column(item.project_id, item_status::backlog)};
    if (item.parent_id) {
        keys.push_back(partition_key::hierarchy(item.project_id));
    }
    auto guard = locks_.acquire(std::move(keys));

    return store_.write([&] {
        auto rank = ranks_.assign_rank(item.project_id, item_status::backlog, position_hint::at_end());
        auto created = store_.create(item, rank);
        store_.append_status_change(created, std::nullopt, ctx.actor_id);

        change_set changes;
        changes.set("title", created.title)
               .set("type", created.type)
               .set("status", std::string(to_string(created.status)))
               .set("rank", created.rank);
        if (created.parent_id) changes.set("parent_id", *created.parent_id);
        store_.append_activity(created, "create", changes.dump(), ctx.actor_id);

        if (ctx.stop.stop_requested()) {
            throw cancelled_error("creation of '" + item.title + "'");
        }
        return created;
    });
}

backlog_item kanban_db::update_item(item_id_t id, const item_patch& patch, const operation_context& ctx) {
    if (!patch.expected_version) {
        throw validation_error("expected_version is required to update item " + std::to_string(id));
    }

    constexpr int max_attempts = 3;
    for (int attempt = 1;; ++attempt) {
        auto peek = store_.get(id);
        auto guard = locks_.acquire({partition_key::column(peek.project_id, peek.status)});

        auto result = store_.write([&]() -> std::optional<backlog_item> {
            auto current = store_.get(id);
            if (current.status != peek.status) {
                return std::nullopt;
            }
            if (*patch.expected_version != current.version) {
                throw conflict_error(id, *patch.expected_version, current.version);
            }

            if (patch.touches_weight() && !current.pause && is_bounded_column(current.status)) {
                auto project = store_.require_project(current.project_id);
                auto resized = current;
                if (patch.estimate_value.present) resized.estimate_value = patch.estimate_value.value;
                if (patch.story_point.present) resized.story_point = patch.story_point.value;
                auto growth = wip_controller::weight_of(resized, project.weighting) -
                              wip_controller::weight_of(current, project.weighting);
                if (growth > 0) {
                    wip_.check_admission(current.project_id, current.status, growth);
                }
            }

            auto updated = store_.update(id, patch);
            if (updated.version == current.version) {
                return updated;
            }

            change_set changes;
            changes.record("title", current.title, updated.title)
                   .record("type", current.type, updated.type)
                   .record("description", current.description, updated.description)
                   .record("reviewer_id", current.reviewer_id, updated.reviewer_id)
                   .record("assignee_id", current.assignee_id, updated.assignee_id)
                   .record("estimate_value", current.estimate_value, updated.estimate_value)
                   .record("story_point", current.story_point, updated.story_point)
                   .record("deadline", current.deadline, updated.deadline);
            store_.append_activity(updated, "update", changes.dump(), ctx.actor_id);

            if (ctx.stop.stop_requested()) {
                throw cancelled_error("update of item " + std::to_string(id));
            }
            return updated;
        });

        if (result) {
            return *result;
        }
        if (attempt >= max_attempts) {
            throw conflict_error(id, peek.version, store_.get(id).version);
        }
    }
}

void kanban_db::delete_item(item_id_t id, std::optional<delete_policy> policy, const operation_context& ctx) {
    hierarchy_.remove(id, policy, ctx);
}

std::vector<backlog_item> kanban_db::list_items(const project_id_t& project_id, const item_filter& filter) const {
    if (project_id.empty()) {
        throw validation_error("project_id is required");
    }
    return store_.read([&] {
        store_.require_project(project_id);
        return store_.list_by_project(project_id, filter);
    });
}

backlog_item kanban_db::reorder(item_id_t id, item_status target_column, std::optional<item_id_t> after,
                                const operation_context& ctx) {
    auto position = after ? position_hint::after(*after) : position_hint::at_start();
    // Both paths check the column under their own locks. An item that reaches
    // target_column before the transition locks it is placed in-column instead
    constexpr int max_attempts = 3;
    for (int attempt = 1;; ++attempt) {
        if (auto placed = ranks_.reorder(id, target_column, after, ctx)) {
            return *placed;
        }
        try {
            return workflow_.transition(id, target_column, position, ctx);
        } catch (const illegal_transition_error& e) {
            if (e.current != target_column || attempt >= max_attempts) {
                throw;
            }
            LOG_DEBUG("kanban", "Item %lld reached %s during reorder, retrying", static_cast<long long>(id),
                      to_string(target_column));
        }
    }
}

// ============================================================================
// History and metrics
// ============================================================================

// History outlives the item, so neither lookup requires it to exist
std::vector<status_change> kanban_db::status_history(item_id_t id) const {
    return store_.status_history(id);
}

std::vector<activity_entry> kanban_db::activity(item_id_t id) const {
    return store_.activity(id);
}

flow_summary kanban_db::flow_metrics(const project_id_t& project_id, timestamp_t now) const {
    return compute_flow_metrics(store_, project_id, now);
}

std::optional<cycle_time_record> kanban_db::cycle_time(item_id_t id) const {
    return compute_cycle_time(store_, id);
}

} // namespace kanban
