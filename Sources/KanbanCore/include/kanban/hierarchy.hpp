#pragma once

#include "locks.hpp"
#include "model.hpp"
#include <cstddef>
#include <iterator>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kanban {

class item_store;

// ============================================================================
// descendant_range - lazy depth-first walk of a subtree
// ============================================================================
//
// Each step queries the store for the children of the item it lands on, so
// nothing is computed until iterated and each begin() starts a fresh walk.
// Items already visited are skipped, which keeps the walk finite even over
// corrupt data.

class descendant_range {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = backlog_item;
        using difference_type = std::ptrdiff_t;
        using pointer = const backlog_item*;
        using reference = const backlog_item&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        bool operator==(const iterator& other) const {
            if (done_ || other.done_) return done_ == other.done_;
            return current_.id == other.current_.id;
        }

        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class descendant_range;

        iterator(const item_store* store, item_id_t root);
        void push_children_of(item_id_t id);
        void advance();

        const item_store* store_ = nullptr;
        // Remaining siblings per depth, next one at the back
        std::vector<std::vector<backlog_item>> frames_;
        std::unordered_set<item_id_t> visited_;
        backlog_item current_;
        bool done_ = true;
    };

    descendant_range(const item_store& store, item_id_t root) : store_(&store), root_(root) {}

    iterator begin() const { return iterator(store_, root_); }
    iterator end() const { return iterator(); }

    /// Drains the walk.
    std::vector<backlog_item> to_vector() const;

private:
    const item_store* store_;
    item_id_t root_;
};

// ============================================================================
// hierarchy_manager - parent/child edges of the per-project forest
// ============================================================================

class hierarchy_manager {
public:
    hierarchy_manager(item_store& store, partition_locks& locks, size_t max_depth);

    /// Moves an item under `new_parent`, or to the roots when empty. Walks
    /// the ancestor chain of the new parent first and refuses the edit with
    /// cycle_error if the item is on it. Reparents within one project are
    /// serialized.
    backlog_item reparent(item_id_t item_id, std::optional<item_id_t> new_parent,
                          const operation_context& ctx = {});

    /// Direct children ordered by (status, rank).
    std::vector<backlog_item> children(item_id_t item_id) const;

    descendant_range descendants(item_id_t item_id) const;

    /// Deletes an item. An item with children needs a policy, otherwise
    /// has_children_error. Cascades delete leaves first.
    void remove(item_id_t item_id, std::optional<delete_policy> policy,
                const operation_context& ctx = {});

    /// Ancestor ids of `item_id`, nearest first. Throws store_error if the
    /// chain exceeds the configured depth or loops.
    std::vector<item_id_t> ancestors(item_id_t item_id) const;

    /// Wraps `roots` in board nodes with their children attached from
    /// `children_by_parent`, `depth` levels deep (empty = whole subtree).
    static std::vector<board_node> attach_children(
        const std::vector<backlog_item>& roots,
        const std::unordered_map<item_id_t, std::vector<const backlog_item*>>& children_by_parent,
        std::optional<size_t> depth);

private:
    void delete_one(const backlog_item& item, const operation_context& ctx);

    item_store& store_;
    partition_locks& locks_;
    size_t max_depth_;
};

} // namespace kanban
