#pragma once

#include "locks.hpp"
#include "model.hpp"
#include "rank.hpp"
#include <optional>
#include <string>
#include <vector>

namespace kanban {

class item_store;
class wip_controller;

/// Adjacent columns only, in either direction. Staying put is not a transition.
bool is_legal_transition(item_status from, item_status to);

std::vector<item_status> legal_targets(item_status from);

// ============================================================================
// workflow_engine - the only path that changes an item's status
// ============================================================================

class workflow_engine {
public:
    workflow_engine(item_store& store, partition_locks& locks,
                    wip_controller& wip, rank_sequencer& ranks);

    /// Moves an item to an adjacent column. Validation, admission, rank
    /// assignment, the status write and its history rows form one unit:
    /// either all of it commits or none of it does.
    ///
    /// Throws illegal_transition_error, wip_exceeded_error, not_found_error,
    /// validation_error (malformed requested rank) or cancelled_error.
    backlog_item transition(item_id_t item_id, item_status target,
                            const std::optional<std::string>& requested_rank = std::nullopt,
                            const operation_context& ctx = {});

    backlog_item transition(item_id_t item_id, item_status target,
                            const position_hint& position, const operation_context& ctx = {});

private:
    item_store& store_;
    partition_locks& locks_;
    wip_controller& wip_;
    rank_sequencer& ranks_;
};

} // namespace kanban
