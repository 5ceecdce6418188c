#pragma once

#include "locks.hpp"
#include "model.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kanban {

class item_store;

// ============================================================================
// Fractional rank keys
// ============================================================================
//
// Keys are base-62 digit strings compared bytewise. A key never ends in the
// zero digit, so a key strictly between any two distinct keys always exists.

namespace rank_keys {
    inline constexpr std::string_view alphabet =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

    bool is_valid(const std::string& key);

    /// A key strictly between `lower` and `upper`. Empty means unbounded on
    /// that side. Throws validation_error unless lower < upper.
    std::string between(const std::string& lower, const std::string& upper);

    /// `count` ascending keys spread evenly over the key space, short enough
    /// to leave room for many inserts between neighbours.
    std::vector<std::string> evenly_spaced(size_t count);
} // namespace rank_keys

/// Where to place an item within its destination column.
struct position_hint {
    enum class kind { end, start, after, exact };

    kind where = kind::end;
    std::optional<item_id_t> anchor;  // after
    std::string key;                  // exact

    static position_hint at_end() { return {}; }
    static position_hint at_start() { return {kind::start, std::nullopt, {}}; }
    static position_hint after(item_id_t item) { return {kind::after, item, {}}; }
    static position_hint exact(std::string key) { return {kind::exact, std::nullopt, std::move(key)}; }
};

// ============================================================================
// rank_sequencer - total order within (project, column)
// ============================================================================

class rank_sequencer {
public:
    rank_sequencer(item_store& store, partition_locks& locks, size_t max_length);

    /// Computes a free key in `column` for `hint`. `moving` is the item being
    /// placed, ignored as a neighbour. When the new key would exceed the
    /// configured length the column is rebalanced once first.
    ///
    /// Joins the caller's write unit; the caller holds the column's partition.
    std::string assign_rank(const project_id_t& project_id, item_status column,
                            const position_hint& hint,
                            std::optional<item_id_t> moving = std::nullopt);

    /// Moves an item within `column` to just after `after`, or to the top
    /// when `after` is empty. Returns nullopt without writing when the item
    /// is not in `column`, as seen under the column lock. Fails
    /// not_found_error if either item is missing or `after` sits in another
    /// column.
    std::optional<backlog_item> reorder(item_id_t item_id, item_status column,
                                        std::optional<item_id_t> after,
                                        const operation_context& ctx = {});

    /// Respaces every key of the column evenly. `exclude` is left parked and
    /// must be given a fresh rank by the caller in the same write unit.
    void rebalance(const project_id_t& project_id, item_status column,
                   std::optional<item_id_t> exclude = std::nullopt);

private:
    std::string key_for(const std::vector<backlog_item>& items, const position_hint& hint) const;

    item_store& store_;
    partition_locks& locks_;
    size_t max_length_;
};

} // namespace kanban
