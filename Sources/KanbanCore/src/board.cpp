#include "kanban/board.hpp"
#include "kanban/hierarchy.hpp"
#include "kanban/item_store.hpp"
#include "kanban/log.hpp"
#include "kanban/wip.hpp"
#include <unordered_map>

namespace kanban {

board_assembler::board_assembler(const item_store& store, std::optional<size_t> child_depth)
    : store_(store), child_depth_(child_depth) {}

kanban_board board_assembler::get_board(const project_id_t& project_id) const {
    // One shared read: no writer can commit between the item query and the limits
    return store_.read([&] {
        auto project = store_.require_project(project_id);
        auto items = store_.list_by_project(project_id);  // ordered by (status, rank)
        auto limits = store_.wip_limits(project_id);

        std::unordered_map<item_id_t, std::vector<const backlog_item*>> children_by_parent;
        std::array<std::vector<backlog_item>, 4> by_column;
        for (const auto& item : items) {
            if (item.parent_id) {
                children_by_parent[*item.parent_id].push_back(&item);
            }
            by_column[static_cast<size_t>(item.status)].push_back(item);
        }

        kanban_board board;
        board.project_id = project_id;
        board.generated_at = now_ms();
        for (auto status : all_statuses) {
            auto& column = board.columns[static_cast<size_t>(status)];
            column.status = status;
            for (const auto& limit : limits) {
                if (limit.column == status) column.limit = limit.limit;
            }
            for (const auto& item : by_column[static_cast<size_t>(status)]) {
                if (!item.pause) column.load += wip_controller::weight_of(item, project.weighting);
            }
            column.items = hierarchy_manager::attach_children(by_column[static_cast<size_t>(status)],
                                                              children_by_parent, child_depth_);
        }

        LOG_DEBUG("board", "Assembled board for '%s' with %zu items", project_id.c_str(), items.size());
        return board;
    });
}

} // namespace kanban
