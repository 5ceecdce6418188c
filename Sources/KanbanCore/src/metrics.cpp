#include "kanban/metrics.hpp"
#include "kanban/item_store.hpp"

namespace kanban {

namespace {

double hours_between(timestamp_t from, timestamp_t to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
}

std::optional<cycle_time_record> cycle_of(const backlog_item& item) {
    if (item.status != item_status::done || !item.started_at || !item.completed_at) {
        return std::nullopt;
    }
    return cycle_time_record{item.id, *item.started_at, *item.completed_at,
                             hours_between(*item.started_at, *item.completed_at)};
}

} // namespace

flow_summary compute_flow_metrics(const item_store& store, const project_id_t& project_id, timestamp_t now) {
    return store.read([&] {
        store.require_project(project_id);

        flow_summary summary;
        double cycle_total = 0.0;
        double lead_total = 0.0;
        int64_t cycle_count = 0;
        auto window_start = now - std::chrono::hours(24 * 7);

        for (const auto& item : store.column_items(project_id, item_status::done)) {
            if (!item.completed_at) continue;
            ++summary.total_completed;
            lead_total += hours_between(item.created_at, *item.completed_at);
            if (auto cycle = cycle_of(item)) {
                cycle_total += cycle->hours;
                ++cycle_count;
            }
            if (*item.completed_at >= window_start && *item.completed_at <= now) {
                ++summary.throughput_per_week;
            }
        }

        for (const auto& item : store.column_items(project_id, item_status::doing)) {
            if (!item.pause) ++summary.work_in_progress;
        }

        if (cycle_count > 0) summary.avg_cycle_time_hours = cycle_total / static_cast<double>(cycle_count);
        if (summary.total_completed > 0) {
            summary.avg_lead_time_hours = lead_total / static_cast<double>(summary.total_completed);
        }
        return summary;
    });
}

std::optional<cycle_time_record> compute_cycle_time(const item_store& store, item_id_t item_id) {
    return cycle_of(store.get(item_id));
}

} // namespace kanban
