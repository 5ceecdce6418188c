#pragma once

#include "config.hpp"
#include "db.hpp"
#include "model.hpp"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace kanban {

// ============================================================================
// item_store - sole owner of BacklogItem, WIPLimit and history rows
// ============================================================================
//
// One connection, one writer at a time. write() runs its block inside a
// BEGIN IMMEDIATE transaction while holding the store mutex exclusively;
// read() holds it shared, so a reader never observes half of a write unit.
// Both nest: a read or write issued from inside a write on the same thread
// joins the enclosing unit. A write must not be started from inside a read.

class item_store {
public:
    explicit item_store(const configuration& config);

    item_store(const item_store&) = delete;
    item_store& operator=(const item_store&) = delete;

    template<typename F>
    auto write(F&& block) -> std::invoke_result_t<F&> {
        using result_t = std::invoke_result_t<F&>;
        if (writer_.load() == std::this_thread::get_id()) {
            return block();
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        writer_scope scope(writer_);
        transaction tx(db_);
        if constexpr (std::is_void_v<result_t>) {
            block();
            tx.commit();
        } else {
            result_t result = block();
            tx.commit();
            return result;
        }
    }

    template<typename F>
    auto read(F&& block) const -> std::invoke_result_t<F&> {
        if (writer_.load() == std::this_thread::get_id() || reading_on_this_thread()) {
            return block();
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        reader_scope scope(this);
        return block();
    }

    // ========================================================================
    // Projects
    // ========================================================================

    /// Records the project and its default (unlimited, hard) Todo and Doing
    /// limits. Registering an existing project returns it unchanged.
    project_record register_project(const project_id_t& project_id, wip_weighting weighting);
    std::optional<project_record> find_project(const project_id_t& project_id) const;
    project_record require_project(const project_id_t& project_id) const;
    project_record set_weighting(const project_id_t& project_id, wip_weighting weighting);

    // ========================================================================
    // Items
    // ========================================================================

    /// Inserts a Backlog item at `rank`. The caller owns rank uniqueness.
    backlog_item create(const new_item& item, const std::string& rank);

    backlog_item get(item_id_t id) const;
    std::optional<backlog_item> find(item_id_t id) const;

    /// Applies a content patch. Fails conflict_error unless
    /// patch.expected_version matches the stored version.
    backlog_item update(item_id_t id, const item_patch& patch);

    /// Deletes a childless item. History rows are kept.
    void remove(item_id_t id);

    std::vector<backlog_item> list_by_project(const project_id_t& project_id,
                                              const item_filter& filter = {}) const;

    /// Items of one column in rank order.
    std::vector<backlog_item> column_items(const project_id_t& project_id, item_status status) const;

    /// Direct children ordered by (status, rank).
    std::vector<backlog_item> children_of(item_id_t id) const;
    size_t count_children(item_id_t id) const;

    /// Writes workflow-owned columns (status, rank, parent_id, pause, ...),
    /// bumping version and updated_at.
    backlog_item set_fields(item_id_t id, std::vector<std::pair<std::string, column_value_t>> values);

    /// Rewrites the ranks of one column, advancing updated_at but leaving
    /// versions alone. Every item in the column is first parked on a key no
    /// generated rank can take, so the unique (project, status, rank) index
    /// holds between statements.
    void rewrite_ranks(const project_id_t& project_id, item_status status,
                       const std::vector<std::pair<item_id_t, std::string>>& ranks);

    // ========================================================================
    // WIP limits
    // ========================================================================

    std::optional<wip_limit> find_wip_limit(const project_id_t& project_id, item_status column) const;
    wip_limit put_wip_limit(const wip_limit& limit);
    std::vector<wip_limit> wip_limits(const project_id_t& project_id) const;

    // ========================================================================
    // History
    // ========================================================================

    void append_status_change(const backlog_item& item, std::optional<item_status> from,
                              const std::optional<user_id_t>& actor_id);
    void append_activity(const backlog_item& item, const std::string& kind,
                         const std::string& changes, const std::optional<user_id_t>& actor_id);

    std::vector<status_change> status_history(item_id_t id) const;
    std::vector<activity_entry> activity(item_id_t id) const;

    database& db() { return db_; }
    const configuration& config() const { return config_; }

private:
    struct writer_scope {
        explicit writer_scope(std::atomic<std::thread::id>& w) : writer(w) {
            writer.store(std::this_thread::get_id());
        }
        ~writer_scope() { writer.store(std::thread::id()); }
        std::atomic<std::thread::id>& writer;
    };

    // Stores this thread is currently reading from
    static std::vector<const item_store*>& active_reads() {
        static thread_local std::vector<const item_store*> stores;
        return stores;
    }

    bool reading_on_this_thread() const {
        const auto& stores = active_reads();
        return std::find(stores.begin(), stores.end(), this) != stores.end();
    }

    struct reader_scope {
        explicit reader_scope(const item_store* s) : store(s) { active_reads().push_back(store); }
        ~reader_scope() {
            auto& stores = active_reads();
            stores.erase(std::find(stores.begin(), stores.end(), store));
        }
        const item_store* store;
    };

    static backlog_item item_from_row(const database::row_t& row);
    static wip_limit limit_from_row(const database::row_t& row);
    static project_record project_from_row(const database::row_t& row);

    configuration config_;
    database db_;
    mutable std::shared_mutex mutex_;
    std::atomic<std::thread::id> writer_{};
};

} // namespace kanban
