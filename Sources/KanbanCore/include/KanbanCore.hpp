#pragma once

// KanbanCore - Kanban board and backlog hierarchy engine over SQLite
//
// Usage:
//   #include <KanbanCore.hpp>
//
//   int main() {
//       kanban::kanban_db db;  // in-memory, or db("board.db")
//       db.register_project("apollo");
//       db.set_wip_limit("apollo", kanban::item_status::doing, 3);
//
//       auto epic = db.create_item({.project_id = "apollo", .title = "Checkout", .type = "epic"});
//       auto story = db.create_item({.project_id = "apollo", .title = "Card form",
//                                    .parent_id = epic.id});
//
//       db.transition(story.id, kanban::item_status::todo);
//       db.transition(story.id, kanban::item_status::doing);  // may throw wip_exceeded_error
//
//       for (const auto& column : db.get_board("apollo").columns) {
//           std::cout << kanban::to_string(column.status) << ": " << column.items.size() << std::endl;
//       }
//   }

#include "kanban/log.hpp"
#include "kanban/types.hpp"
#include "kanban/errors.hpp"
#include "kanban/config.hpp"
#include "kanban/db.hpp"
#include "kanban/schema.hpp"
#include "kanban/model.hpp"
#include "kanban/json.hpp"
#include "kanban/item_store.hpp"
#include "kanban/locks.hpp"
#include "kanban/rank.hpp"
#include "kanban/wip.hpp"
#include "kanban/workflow.hpp"
#include "kanban/hierarchy.hpp"
#include "kanban/board.hpp"
#include "kanban/metrics.hpp"
#include "kanban/kanban.hpp"
