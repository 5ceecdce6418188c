#include "kanban/wip.hpp"
#include "kanban/item_store.hpp"
#include "kanban/json.hpp"
#include "kanban/log.hpp"
#include <limits>

namespace kanban {

wip_controller::wip_controller(item_store& store, partition_locks& locks)
    : store_(store), locks_(locks) {}

int64_t wip_controller::weight_of(const backlog_item& item, wip_weighting weighting) {
    if (weighting == wip_weighting::count) {
        return 1;
    }
    if (item.story_point) return *item.story_point;
    if (item.estimate_value) return *item.estimate_value;
    return 1;
}

int64_t wip_controller::current_load(const project_id_t& project_id, item_status column) const {
    return store_.read([&] {
        auto project = store_.require_project(project_id);
        int64_t load = 0;
        for (const auto& item : store_.column_items(project_id, column)) {
            if (!item.pause) {
                // Saturates rather than wrapping
                auto weight = weight_of(item, project.weighting);
                load = weight > std::numeric_limits<int64_t>::max() - load
                           ? std::numeric_limits<int64_t>::max()
                           : load + weight;
            }
        }
        return load;
    });
}

admission wip_controller::check_admission(const project_id_t& project_id, item_status column,
                                          int64_t incoming_weight) const {
    return store_.read([&] {
        admission result;
        result.column = column;
        result.incoming_weight = incoming_weight;
        result.load_before = current_load(project_id, column);

        auto limit = get_limit(project_id, column);
        result.limit = limit.limit;
        // load_before and the limit are both non-negative, so the difference cannot overflow
        if (limit.is_unlimited() ||
            (result.load_before <= *limit.limit && incoming_weight <= *limit.limit - result.load_before)) {
            return result;
        }

        if (limit.type == limit_type::soft) {
            result.soft_overrun = true;
            LOG_WARN("wip", "Soft limit %lld exceeded in %s of '%s' (load %lld + %lld)",
                     static_cast<long long>(*limit.limit), to_string(column), project_id.c_str(),
                     static_cast<long long>(result.load_before), static_cast<long long>(incoming_weight));
            return result;
        }

        LOG_INFO("wip", "Denied admission to %s of '%s': load %lld + %lld > %lld",
                 to_string(column), project_id.c_str(), static_cast<long long>(result.load_before),
                 static_cast<long long>(incoming_weight), static_cast<long long>(*limit.limit));
        throw wip_exceeded_error(project_id, column, result.load_before, incoming_weight, *limit.limit);
    });
}

wip_limit wip_controller::get_limit(const project_id_t& project_id, item_status column) const {
    return store_.read([&] {
        store_.require_project(project_id);
        if (auto stored = store_.find_wip_limit(project_id, column)) {
            return *stored;
        }
        wip_limit unlimited;
        unlimited.project_id = project_id;
        unlimited.column = column;
        return unlimited;
    });
}

wip_limit wip_controller::set_limit(const project_id_t& project_id, item_status column,
                                    std::optional<int64_t> limit, limit_type type) {
    if (!is_bounded_column(column)) {
        throw validation_error(std::string(to_string(column)) + " does not take a WIP limit");
    }
    if (limit && *limit <= 0) {
        throw validation_error("WIP limit must be positive, got " + std::to_string(*limit));
    }

    auto guard = locks_.acquire({partition_key::column(project_id, column)});
    return store_.write([&] {
        store_.require_project(project_id);
        wip_limit updated;
        updated.project_id = project_id;
        updated.column = column;
        updated.limit = limit;
        updated.type = type;
        auto stored = store_.put_wip_limit(updated);
        LOG_INFO("wip", "WIP limit for %s of '%s' set to %s (%s)", to_string(column), project_id.c_str(),
                 limit ? std::to_string(*limit).c_str() : "unlimited", to_string(type));
        return stored;
    });
}

std::vector<wip_usage> wip_controller::usage(const project_id_t& project_id) const {
    return store_.read([&] {
        std::vector<wip_usage> report;
        for (auto column : all_statuses) {
            if (!is_bounded_column(column)) continue;
            auto limit = get_limit(project_id, column);
            wip_usage entry;
            entry.column = column;
            entry.limit = limit.limit;
            entry.type = limit.type;
            entry.load = current_load(project_id, column);
            if (limit.limit) {
                entry.available = std::max<int64_t>(*limit.limit - entry.load, 0);
            }
            report.push_back(entry);
        }
        return report;
    });
}

backlog_item wip_controller::set_pause(item_id_t item_id, bool pause, const operation_context& ctx) {
    constexpr int max_attempts = 3;
    for (int attempt = 1;; ++attempt) {
        auto peek = store_.get(item_id);
        auto guard = locks_.acquire({partition_key::column(peek.project_id, peek.status)});

        auto result = store_.write([&]() -> std::optional<backlog_item> {
            auto current = store_.get(item_id);
            if (current.status != peek.status) {
                return std::nullopt;
            }
            if (current.pause == pause) {
                return current;
            }

            if (!pause) {
                auto project = store_.require_project(current.project_id);
                check_admission(current.project_id, current.status, weight_of(current, project.weighting));
            }

            auto updated = store_.set_fields(item_id, {{"pause", detail::to_column_value(pause)}});
            change_set changes;
            changes.record("pause", current.pause, updated.pause);
            store_.append_activity(updated, "pause", changes.dump(), ctx.actor_id);

            if (ctx.stop.stop_requested()) {
                throw cancelled_error(std::string(pause ? "pause" : "resume") + " of item " + std::to_string(item_id));
            }
            return updated;
        });

        if (result) {
            return *result;
        }
        if (attempt >= max_attempts) {
            throw conflict_error(item_id, peek.version, store_.get(item_id).version);
        }
    }
}

} // namespace kanban
