#pragma once

#include "types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <optional>

namespace kanban {

enum class item_status : int;

class kanban_error : public std::runtime_error {
public:
    explicit kanban_error(const std::string& msg) : std::runtime_error(msg) {}
};

/// SQLite failure (open, prepare, step, transaction control).
class store_error : public kanban_error {
public:
    explicit store_error(const std::string& msg) : kanban_error(msg) {}
};

/// Malformed input, rejected before any write.
class validation_error : public kanban_error {
public:
    explicit validation_error(const std::string& msg) : kanban_error(msg) {}
};

class not_found_error : public kanban_error {
public:
    explicit not_found_error(const std::string& msg) : kanban_error(msg) {}
};

/// Optimistic-concurrency mismatch: the caller's patch was based on a stale version.
class conflict_error : public kanban_error {
public:
    conflict_error(item_id_t item, int64_t expected, int64_t actual)
        : kanban_error("Version conflict on item " + std::to_string(item) +
                       ": expected " + std::to_string(expected) +
                       ", current " + std::to_string(actual))
        , item_id(item), expected_version(expected), actual_version(actual) {}

    item_id_t item_id;
    int64_t expected_version;
    int64_t actual_version;
};

class cycle_error : public kanban_error {
public:
    cycle_error(item_id_t item, item_id_t parent)
        : kanban_error("Reparenting item " + std::to_string(item) + " under " +
                       std::to_string(parent) + " would create a cycle")
        , item_id(item), parent_id(parent) {}

    item_id_t item_id;
    item_id_t parent_id;
};

class cross_project_error : public kanban_error {
public:
    cross_project_error(item_id_t item, const project_id_t& item_project, const project_id_t& parent_project)
        : kanban_error("Item " + std::to_string(item) + " belongs to project '" + item_project +
                       "' but the parent belongs to '" + parent_project + "'")
        , item_id(item), item_project_id(item_project), parent_project_id(parent_project) {}

    item_id_t item_id;
    project_id_t item_project_id;
    project_id_t parent_project_id;
};

class has_children_error : public kanban_error {
public:
    has_children_error(item_id_t item, size_t count)
        : kanban_error("Item " + std::to_string(item) + " has " + std::to_string(count) +
                       " children; a delete policy is required")
        , item_id(item), child_count(count) {}

    item_id_t item_id;
    size_t child_count;
};

class illegal_transition_error : public kanban_error {
public:
    illegal_transition_error(item_id_t item, item_status current, item_status attempted);

    item_id_t item_id;
    item_status current;
    item_status attempted;
};

/// Admission denied. An expected business outcome rather than a fault.
class wip_exceeded_error : public kanban_error {
public:
    wip_exceeded_error(const project_id_t& project, item_status column,
                       int64_t load, int64_t incoming, int64_t limit);

    project_id_t project_id;
    item_status column;
    int64_t current_load;
    int64_t incoming_weight;
    int64_t limit;
};

/// The caller requested a stop before the operation committed; nothing was written.
class cancelled_error : public kanban_error {
public:
    explicit cancelled_error(const std::string& operation)
        : kanban_error(operation + " cancelled before commit") {}
};

} // namespace kanban
