#pragma once

#include "types.hpp"
#include "model.hpp"
#include <compare>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace kanban {

/// Lane used for hierarchy edits; sorts after every workflow column.
inline constexpr int hierarchy_lane = 16;

/// A serialization domain: one workflow column of one project, or a project's hierarchy.
struct partition_key {
    project_id_t project;
    int lane = 0;

    static partition_key column(const project_id_t& project, item_status status) {
        return {project, static_cast<int>(status)};
    }

    static partition_key hierarchy(const project_id_t& project) {
        return {project, hierarchy_lane};
    }

    auto operator<=>(const partition_key&) const = default;
};

// ============================================================================
// Keyed critical sections. Keys are always locked in ascending order, so two
// callers asking for overlapping sets cannot deadlock.
// ============================================================================

class partition_locks {
public:
    class guard {
    public:
        guard() = default;
        guard(guard&&) noexcept = default;
        guard& operator=(guard&&) noexcept = default;
        ~guard() { release(); }

        void release() {
            // Unlock in reverse acquisition order
            while (!held_.empty()) {
                held_.pop_back();
            }
        }

        size_t size() const { return held_.size(); }

    private:
        friend class partition_locks;
        std::vector<std::unique_lock<std::mutex>> held_;
    };

    partition_locks() = default;
    partition_locks(const partition_locks&) = delete;
    partition_locks& operator=(const partition_locks&) = delete;

    /// Blocks until every key is held. Duplicate keys are collapsed.
    guard acquire(std::vector<partition_key> keys);

private:
    std::shared_ptr<std::mutex> mutex_for(const partition_key& key);

    std::mutex registry_mutex_;
    std::map<partition_key, std::shared_ptr<std::mutex>> mutexes_;
};

} // namespace kanban
