#pragma once

#include "model.hpp"
#include <optional>

namespace kanban {

class item_store;

// ============================================================================
// board_assembler - read-only projection of a project's board
// ============================================================================

class board_assembler {
public:
    /// `child_depth`: empty attaches whole subtrees, 1 direct children only.
    board_assembler(const item_store& store, std::optional<size_t> child_depth);

    /// All four columns from one snapshot, each in ascending rank order, each
    /// card carrying its children ordered by (status, rank).
    kanban_board get_board(const project_id_t& project_id) const;

private:
    const item_store& store_;
    std::optional<size_t> child_depth_;
};

} // namespace kanban
