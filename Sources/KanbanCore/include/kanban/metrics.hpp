#pragma once

#include "model.hpp"
#include <optional>

namespace kanban {

class item_store;

/// Flow figures over the items currently in Done. Throughput counts the
/// completions in the seven days before `now`.
flow_summary compute_flow_metrics(const item_store& store, const project_id_t& project_id, timestamp_t now);

/// Started-to-completed time of one item; empty until it is in Done with both stamps.
std::optional<cycle_time_record> compute_cycle_time(const item_store& store, item_id_t item_id);

} // namespace kanban
