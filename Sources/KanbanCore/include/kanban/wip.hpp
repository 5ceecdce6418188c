#pragma once

#include "locks.hpp"
#include "model.hpp"
#include <optional>
#include <vector>

namespace kanban {

class item_store;

// ============================================================================
// wip_controller - admission control for the bounded columns
// ============================================================================

class wip_controller {
public:
    wip_controller(item_store& store, partition_locks& locks);

    /// Weight an item contributes to its column's load.
    static int64_t weight_of(const backlog_item& item, wip_weighting weighting);

    /// Sum of weights of the non-paused items in the column.
    int64_t current_load(const project_id_t& project_id, item_status column) const;

    /// Admits `incoming_weight` into the column or throws wip_exceeded_error.
    /// A soft limit admits and reports the overrun. Joins the caller's write
    /// unit; the caller holds the column's partition so the load it checks
    /// against cannot change before its own write commits.
    admission check_admission(const project_id_t& project_id, item_status column,
                              int64_t incoming_weight) const;

    /// Backlog and Done always report an unlimited hard limit.
    wip_limit get_limit(const project_id_t& project_id, item_status column) const;

    /// `limit` must be positive, or empty for unlimited. Only Todo and Doing
    /// accept a limit. Lowering below the current load is allowed: limits
    /// only gate entry.
    wip_limit set_limit(const project_id_t& project_id, item_status column,
                        std::optional<int64_t> limit, limit_type type = limit_type::hard);

    std::vector<wip_usage> usage(const project_id_t& project_id) const;

    /// Pausing leaves the load at once. Resuming re-enters the item into its
    /// column's load and must pass admission.
    backlog_item set_pause(item_id_t item_id, bool pause, const operation_context& ctx = {});

private:
    item_store& store_;
    partition_locks& locks_;
};

} // namespace kanban
