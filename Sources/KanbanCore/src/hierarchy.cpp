#include "kanban/hierarchy.hpp"
#include "kanban/item_store.hpp"
#include "kanban/json.hpp"
#include "kanban/log.hpp"
#include <algorithm>

namespace kanban {

// ============================================================================
// descendant_range
// ============================================================================

descendant_range::iterator::iterator(const item_store* store, item_id_t root)
    : store_(store), done_(false) {
    visited_.insert(root);
    push_children_of(root);
    advance();
}

void descendant_range::iterator::push_children_of(item_id_t id) {
    auto children = store_->children_of(id);
    std::reverse(children.begin(), children.end());
    frames_.push_back(std::move(children));
}

void descendant_range::iterator::advance() {
    while (!frames_.empty()) {
        auto& siblings = frames_.back();
        if (siblings.empty()) {
            frames_.pop_back();
            continue;
        }
        backlog_item next = std::move(siblings.back());
        siblings.pop_back();
        if (!visited_.insert(next.id).second) {
            continue;
        }
        current_ = std::move(next);
        push_children_of(current_.id);
        return;
    }
    done_ = true;
}

std::vector<backlog_item> descendant_range::to_vector() const {
    std::vector<backlog_item> items;
    for (const auto& item : *this) {
        items.push_back(item);
    }
    return items;
}

// ============================================================================
// hierarchy_manager
// ============================================================================

hierarchy_manager::hierarchy_manager(item_store& store, partition_locks& locks, size_t max_depth)
    : store_(store), locks_(locks), max_depth_(max_depth) {}

std::vector<item_id_t> hierarchy_manager::ancestors(item_id_t item_id) const {
    return store_.read([&] {
        std::vector<item_id_t> chain;
        std::unordered_set<item_id_t> seen{item_id};
        auto next = store_.get(item_id).parent_id;
        while (next) {
            if (!seen.insert(*next).second) {
                LOG_ERROR("hierarchy", "Parent chain of item %lld loops at %lld",
                          static_cast<long long>(item_id), static_cast<long long>(*next));
                throw store_error("Parent chain of item " + std::to_string(item_id) + " contains a loop");
            }
            if (chain.size() >= max_depth_) {
                LOG_ERROR("hierarchy", "Parent chain of item %lld exceeds %zu levels",
                          static_cast<long long>(item_id), max_depth_);
                throw store_error("Parent chain of item " + std::to_string(item_id) + " is deeper than " +
                                  std::to_string(max_depth_));
            }
            chain.push_back(*next);
            auto parent = store_.find(*next);
            if (!parent) break;
            next = parent->parent_id;
        }
        return chain;
    });
}

backlog_item hierarchy_manager::reparent(item_id_t item_id, std::optional<item_id_t> new_parent,
                                         const operation_context& ctx) {
    auto peek = store_.get(item_id);
    if (new_parent && *new_parent == item_id) {
        throw cycle_error(item_id, item_id);
    }

    auto guard = locks_.acquire({partition_key::hierarchy(peek.project_id)});
    return store_.write([&] {
        auto current = store_.get(item_id);

        if (new_parent) {
            auto parent = store_.find(*new_parent);
            if (!parent) {
                throw not_found_error("Parent item " + std::to_string(*new_parent) + " not found");
            }
            if (parent->project_id != current.project_id) {
                throw cross_project_error(item_id, current.project_id, parent->project_id);
            }
            auto chain = ancestors(*new_parent);
            if (std::find(chain.begin(), chain.end(), item_id) != chain.end()) {
                LOG_INFO("hierarchy", "Refused to place item %lld under its descendant %lld",
                         static_cast<long long>(item_id), static_cast<long long>(*new_parent));
                throw cycle_error(item_id, *new_parent);
            }
        }

        if (current.parent_id == new_parent) {
            return current;
        }

        auto updated = store_.set_fields(item_id, {{"parent_id", detail::to_column_value(new_parent)}});
        change_set changes;
        changes.record("parent_id", current.parent_id, updated.parent_id);
        store_.append_activity(updated, "reparent", changes.dump(), ctx.actor_id);

        if (ctx.stop.stop_requested()) {
            throw cancelled_error("reparent of item " + std::to_string(item_id));
        }
        return updated;
    });
}

std::vector<backlog_item> hierarchy_manager::children(item_id_t item_id) const {
    return store_.read([&] {
        store_.get(item_id);
        return store_.children_of(item_id);
    });
}

descendant_range hierarchy_manager::descendants(item_id_t item_id) const {
    store_.get(item_id);
    return descendant_range(store_, item_id);
}

void hierarchy_manager::delete_one(const backlog_item& item, const operation_context& ctx) {
    change_set changes;
    changes.record("status", std::optional<std::string>(to_string(item.status)), std::optional<std::string>());
    changes.record("parent_id", item.parent_id, std::optional<item_id_t>());
    store_.append_activity(item, "delete", changes.dump(), ctx.actor_id);
    store_.remove(item.id);
}

void hierarchy_manager::remove(item_id_t item_id, std::optional<delete_policy> policy,
                               const operation_context& ctx) {
    auto peek = store_.get(item_id);

    // Column loads and ranks change along with the tree
    std::vector<partition_key> keys{partition_key::hierarchy(peek.project_id)};
    for (auto status : all_statuses) {
        keys.push_back(partition_key::column(peek.project_id, status));
    }
    auto guard = locks_.acquire(std::move(keys));

    store_.write([&] {
        auto current = store_.get(item_id);
        auto direct = store_.children_of(item_id);
        if (!direct.empty() && !policy) {
            LOG_INFO("hierarchy", "Refused to delete item %lld with %zu children",
                     static_cast<long long>(item_id), direct.size());
            throw has_children_error(item_id, direct.size());
        }

        if (!direct.empty() && *policy == delete_policy::detach_children) {
            for (const auto& child : direct) {
                auto detached = store_.set_fields(child.id, {{"parent_id", nullptr}});
                change_set changes;
                changes.record("parent_id", child.parent_id, detached.parent_id);
                store_.append_activity(detached, "reparent", changes.dump(), ctx.actor_id);
            }
        } else if (!direct.empty()) {
            // Reverse pre-order puts every descendant before its ancestors
            auto subtree = descendant_range(store_, item_id).to_vector();
            for (auto it = subtree.rbegin(); it != subtree.rend(); ++it) {
                delete_one(*it, ctx);
            }
            LOG_INFO("hierarchy", "Cascade removed %zu descendants of item %lld",
                     subtree.size(), static_cast<long long>(item_id));
        }
        delete_one(current, ctx);

        if (ctx.stop.stop_requested()) {
            throw cancelled_error("delete of item " + std::to_string(item_id));
        }
    });
}

// ============================================================================
// Board attachment
// ============================================================================

namespace {

board_node make_node(const backlog_item& item,
                     const std::unordered_map<item_id_t, std::vector<const backlog_item*>>& children_by_parent,
                     std::optional<size_t> depth, std::unordered_set<item_id_t>& path) {
    board_node node{item, {}};
    if (depth && *depth == 0) {
        return node;
    }
    auto it = children_by_parent.find(item.id);
    if (it == children_by_parent.end()) {
        return node;
    }

    std::optional<size_t> remaining;
    if (depth) remaining = *depth - 1;

    path.insert(item.id);
    for (const auto* child : it->second) {
        if (path.count(child->id)) continue;
        node.children.push_back(make_node(*child, children_by_parent, remaining, path));
    }
    path.erase(item.id);
    return node;
}

} // namespace

std::vector<board_node> hierarchy_manager::attach_children(
    const std::vector<backlog_item>& roots,
    const std::unordered_map<item_id_t, std::vector<const backlog_item*>>& children_by_parent,
    std::optional<size_t> depth) {
    std::vector<board_node> nodes;
    nodes.reserve(roots.size());
    std::unordered_set<item_id_t> path;
    for (const auto& item : roots) {
        nodes.push_back(make_node(item, children_by_parent, depth, path));
    }
    return nodes;
}

} // namespace kanban
