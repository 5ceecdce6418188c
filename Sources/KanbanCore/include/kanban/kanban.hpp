#pragma once

#include "board.hpp"
#include "config.hpp"
#include "hierarchy.hpp"
#include "item_store.hpp"
#include "locks.hpp"
#include "model.hpp"
#include "rank.hpp"
#include "wip.hpp"
#include "workflow.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kanban {

// ============================================================================
// kanban_db - entry point for the request layer
// ============================================================================
//
// Owns the store and wires the components over it. Every method is safe to
// call from any thread; reads run concurrently, writes serialize per
// partition and then on the store.

class kanban_db {
public:
    // In-memory board
    kanban_db() : kanban_db(configuration()) {}

    explicit kanban_db(const std::string& path) : kanban_db(configuration(path)) {}

    explicit kanban_db(const configuration& config);

    // Non-copyable and non-moveable (components hold references into it)
    kanban_db(const kanban_db&) = delete;
    kanban_db& operator=(const kanban_db&) = delete;
    kanban_db(kanban_db&&) = delete;
    kanban_db& operator=(kanban_db&&) = delete;

    // ========================================================================
    // MARK: Projects
    // ========================================================================

    project_record register_project(const project_id_t& project_id,
                                    wip_weighting weighting = wip_weighting::count);
    project_record set_wip_weighting(const project_id_t& project_id, wip_weighting weighting);

    // ========================================================================
    // MARK: Items
    // ========================================================================

    /// Creates an item at the bottom of Backlog.
    /// Usage: auto story = db.create_item({.project_id = "p", .title = "Login"});
    backlog_item create_item(const new_item& item, const operation_context& ctx = {});

    backlog_item get_item(item_id_t id) const { return store_.get(id); }
    std::optional<backlog_item> find_item(item_id_t id) const { return store_.find(id); }

    /// Content patch guarded by patch.expected_version. Raising the size of
    /// an active item in a bounded column must pass admission for the increase.
    backlog_item update_item(item_id_t id, const item_patch& patch, const operation_context& ctx = {});

    void delete_item(item_id_t id, std::optional<delete_policy> policy = std::nullopt,
                     const operation_context& ctx = {});

    std::vector<backlog_item> list_items(const project_id_t& project_id, const item_filter& filter = {}) const;

    // ========================================================================
    // MARK: Workflow and ordering
    // ========================================================================

    backlog_item transition(item_id_t id, item_status target,
                            const std::optional<std::string>& requested_rank = std::nullopt,
                            const operation_context& ctx = {}) {
        return workflow_.transition(id, target, requested_rank, ctx);
    }

    backlog_item transition(item_id_t id, item_status target, const position_hint& position,
                            const operation_context& ctx = {}) {
        return workflow_.transition(id, target, position, ctx);
    }

    /// Places an item after `after` (or first when empty) in `target_column`.
    /// A different column makes this a transition.
    backlog_item reorder(item_id_t id, item_status target_column, std::optional<item_id_t> after,
                         const operation_context& ctx = {});

    // ========================================================================
    // MARK: Hierarchy
    // ========================================================================

    backlog_item reparent(item_id_t id, std::optional<item_id_t> new_parent,
                          const operation_context& ctx = {}) {
        return hierarchy_.reparent(id, new_parent, ctx);
    }

    std::vector<backlog_item> children(item_id_t id) const { return hierarchy_.children(id); }
    descendant_range descendants(item_id_t id) const { return hierarchy_.descendants(id); }

    // ========================================================================
    // MARK: WIP
    // ========================================================================

    backlog_item set_pause(item_id_t id, bool pause, const operation_context& ctx = {}) {
        return wip_.set_pause(id, pause, ctx);
    }

    wip_limit get_wip_limit(const project_id_t& project_id, item_status column) const {
        return wip_.get_limit(project_id, column);
    }

    wip_limit set_wip_limit(const project_id_t& project_id, item_status column,
                            std::optional<int64_t> limit, limit_type type = limit_type::hard) {
        return wip_.set_limit(project_id, column, limit, type);
    }

    /// Preview only. Transitions repeat the check under the column lock.
    admission check_admission(const project_id_t& project_id, item_status column, int64_t incoming_weight) const {
        return wip_.check_admission(project_id, column, incoming_weight);
    }

    std::vector<wip_usage> get_wip_usage(const project_id_t& project_id) const { return wip_.usage(project_id); }

    // ========================================================================
    // MARK: Board, history and metrics
    // ========================================================================

    kanban_board get_board(const project_id_t& project_id) const { return board_.get_board(project_id); }

    std::vector<status_change> status_history(item_id_t id) const;
    std::vector<activity_entry> activity(item_id_t id) const;

    flow_summary flow_metrics(const project_id_t& project_id, timestamp_t now = now_ms()) const;
    std::optional<cycle_time_record> cycle_time(item_id_t id) const;

    const configuration& config() const { return config_; }
    item_store& store() { return store_; }

private:
    configuration config_;
    item_store store_;
    partition_locks locks_;
    wip_controller wip_;
    rank_sequencer ranks_;
    workflow_engine workflow_;
    hierarchy_manager hierarchy_;
    board_assembler board_;
};

} // namespace kanban
