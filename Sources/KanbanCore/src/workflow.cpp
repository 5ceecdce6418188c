#include "kanban/workflow.hpp"
#include "kanban/item_store.hpp"
#include "kanban/json.hpp"
#include "kanban/log.hpp"
#include "kanban/wip.hpp"
#include <cstdlib>

namespace kanban {

bool is_legal_transition(item_status from, item_status to) {
    return std::abs(static_cast<int>(from) - static_cast<int>(to)) == 1;
}

std::vector<item_status> legal_targets(item_status from) {
    std::vector<item_status> targets;
    for (auto status : all_statuses) {
        if (is_legal_transition(from, status)) {
            targets.push_back(status);
        }
    }
    return targets;
}

workflow_engine::workflow_engine(item_store& store, partition_locks& locks,
                                 wip_controller& wip, rank_sequencer& ranks)
    : store_(store), locks_(locks), wip_(wip), ranks_(ranks) {}

backlog_item workflow_engine::transition(item_id_t item_id, item_status target,
                                         const std::optional<std::string>& requested_rank,
                                         const operation_context& ctx) {
    return transition(item_id, target,
                      requested_rank ? position_hint::exact(*requested_rank) : position_hint::at_end(),
                      ctx);
}

backlog_item workflow_engine::transition(item_id_t item_id, item_status target,
                                         const position_hint& position, const operation_context& ctx) {
    // The source column is only known after a read; the locks are taken on
    // what was read and the unit retries if the item moved meanwhile
    constexpr int max_attempts = 3;
    for (int attempt = 1;; ++attempt) {
        auto peek = store_.get(item_id);
        auto guard = locks_.acquire({partition_key::column(peek.project_id, peek.status),
                                     partition_key::column(peek.project_id, target)});

        auto result = store_.write([&]() -> std::optional<backlog_item> {
            auto current = store_.get(item_id);
            if (current.status != peek.status) {
                return std::nullopt;
            }
            if (!is_legal_transition(current.status, target)) {
                LOG_INFO("workflow", "Rejected %s -> %s for item %lld", to_string(current.status),
                         to_string(target), static_cast<long long>(item_id));
                throw illegal_transition_error(item_id, current.status, target);
            }

            // Paused items carry no load, so they enter without admission
            if (!current.pause) {
                auto project = store_.require_project(current.project_id);
                wip_.check_admission(current.project_id, target,
                                     wip_controller::weight_of(current, project.weighting));
            }

            auto rank = ranks_.assign_rank(current.project_id, target, position, item_id);

            std::vector<std::pair<std::string, column_value_t>> values{
                {"status", detail::to_column_value(static_cast<int>(target))},
                {"rank", rank},
            };
            auto now = now_ms();
            if (target == item_status::doing && !current.started_at) {
                values.emplace_back("started_at", detail::to_column_value(now));
            }
            if (target == item_status::done) {
                values.emplace_back("completed_at", detail::to_column_value(now));
            } else if (current.status == item_status::done) {
                values.emplace_back("completed_at", nullptr);
            }

            auto updated = store_.set_fields(item_id, std::move(values));
            store_.append_status_change(updated, current.status, ctx.actor_id);

            change_set changes;
            changes.record("status", std::string(to_string(current.status)), std::string(to_string(updated.status)))
                   .record("rank", current.rank, updated.rank);
            store_.append_activity(updated, "transition", changes.dump(), ctx.actor_id);

            if (ctx.stop.stop_requested()) {
                throw cancelled_error("transition of item " + std::to_string(item_id));
            }
            return updated;
        });

        if (result) {
            LOG_DEBUG("workflow", "Item %lld moved %s -> %s", static_cast<long long>(item_id),
                      to_string(peek.status), to_string(target));
            return *result;
        }
        if (attempt >= max_attempts) {
            throw conflict_error(item_id, peek.version, store_.get(item_id).version);
        }
        LOG_DEBUG("workflow", "Item %lld changed column during transition, retrying", static_cast<long long>(item_id));
    }
}

} // namespace kanban
