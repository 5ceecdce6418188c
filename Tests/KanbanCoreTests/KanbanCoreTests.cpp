#include <KanbanCore.hpp>
#include <cassert>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <limits>
#include <set>
#include <stop_token>
#include <unistd.h>

#include "RankTests.hpp"
#include "ConcurrencyTests.hpp"

using kanban::item_status;

namespace {

template<typename E, typename F>
bool throws(F&& block) {
    try {
        block();
    } catch (const E&) {
        return true;
    }
    return false;
}

kanban::backlog_item make_item(kanban::kanban_db& db, const std::string& project, const std::string& title,
                               std::optional<kanban::item_id_t> parent = std::nullopt) {
    return db.create_item({.project_id = project, .title = title, .parent_id = parent});
}

/// Walks an item forward through adjacent columns up to `target`.
kanban::backlog_item advance_to(kanban::kanban_db& db, kanban::item_id_t id, item_status target) {
    auto item = db.get_item(id);
    while (item.status != target) {
        item = db.transition(id, static_cast<item_status>(static_cast<int>(item.status) + 1));
    }
    return item;
}

} // namespace

// ============================================================================
// Test: Logging and configuration
// ============================================================================

void test_log_levels() {
    std::cout << "Testing log levels..." << std::endl;

    kanban::log_level level = kanban::log_level::off;
    assert(kanban::parse_log_level("debug", level));
    assert(level == kanban::log_level::debug);
    assert(kanban::parse_log_level("warn", level));
    assert(level == kanban::log_level::warn);
    assert(!kanban::parse_log_level("verbose", level));
    assert(std::string(kanban::to_string(kanban::log_level::info)) == "info");

    kanban::set_log_level(kanban::log_level::error);
    assert(kanban::get_log_level() == kanban::log_level::error);
    kanban::set_log_level(kanban::log_level::off);

    std::cout << "  Log level test passed!" << std::endl;
}

void test_configuration() {
    std::cout << "Testing configuration..." << std::endl;

    auto config = kanban::configuration::from_json(nlohmann::json{
        {"path", "board.db"},
        {"busy_timeout_ms", 250},
        {"board_child_depth", 1},
        {"rank_max_length", 8},
        {"log_level", "warn"},
        {"unknown_key", true},
    });
    assert(config.path == "board.db");
    assert(config.busy_timeout_ms == 250);
    assert(config.board_child_depth == 1u);
    assert(config.rank_max_length == 8);
    assert(config.max_hierarchy_depth == 4096);
    assert(config.level == kanban::log_level::warn);

    auto defaults = kanban::configuration::from_json(nlohmann::json::object());
    assert(defaults.path == ":memory:");
    assert(!defaults.board_child_depth);

    assert(throws<kanban::validation_error>([] {
        kanban::configuration::from_json(nlohmann::json::array());
    }));
    assert(throws<kanban::validation_error>([] {
        kanban::configuration::from_json(nlohmann::json{{"busy_timeout_ms", "soon"}});
    }));
    assert(throws<kanban::validation_error>([] {
        kanban::configuration::from_json(nlohmann::json{{"log_level", "loud"}});
    }));
    assert(throws<kanban::validation_error>([] {
        kanban::configuration::from_json(nlohmann::json{{"rank_max_length", 2}});
    }));

    auto dir = std::filesystem::temp_directory_path();
    auto file = dir / ("kanban_config_" + std::to_string(getpid()) + ".json");
    {
        std::ofstream out(file);
        out << R"({"path": ":memory:", "board_child_depth": 0})";
    }
    auto loaded = kanban::load_configuration(file.string());
    assert(loaded.board_child_depth == 0u);
    {
        std::ofstream out(file);
        out << "{not json";
    }
    assert(throws<kanban::validation_error>([&] { kanban::load_configuration(file.string()); }));
    std::filesystem::remove(file);
    assert(throws<kanban::not_found_error>([&] { kanban::load_configuration(file.string()); }));

    std::cout << "  Configuration test passed!" << std::endl;
}

// ============================================================================
// Test: Item store (create, get, update, delete, list)
// ============================================================================

void test_item_crud() {
    std::cout << "Testing item CRUD..." << std::endl;

    kanban::kanban_db db;
    auto project = db.register_project("P");
    assert(project.weighting == kanban::wip_weighting::count);
    // Registering again is a no-op
    db.register_project("P", kanban::wip_weighting::points);
    assert(db.store().require_project("P").weighting == kanban::wip_weighting::count);

    auto item = db.create_item({
        .project_id = "P",
        .title = "Login form",
        .type = "story",
        .description = "Email and password",
        .assignee_id = "ana",
        .story_point = 3,
    });
    assert(item.id > 0);
    assert(item.status == item_status::backlog);
    assert(item.version == 1);
    assert(item.global_id.size() == 36);
    assert(item.created_at == item.updated_at);
    assert(kanban::rank_keys::is_valid(item.rank));

    auto fetched = db.get_item(item.id);
    assert(fetched.title == "Login form");
    assert(fetched.description == "Email and password");
    assert(fetched.assignee_id == "ana");
    assert(fetched.story_point == 3);
    assert(!fetched.estimate_value);
    assert(fetched.created_at == item.created_at);

    kanban::item_patch patch;
    patch.expected_version = item.version;
    patch.title = "Login and signup";
    patch.description = std::nullopt;
    patch.estimate_value = int64_t{5};
    auto updated = db.update_item(item.id, patch);
    assert(updated.title == "Login and signup");
    assert(!updated.description);
    assert(updated.estimate_value == 5);
    assert(updated.version == 2);
    assert(updated.updated_at >= item.updated_at);

    // Same patch again is based on a stale version
    bool conflicted = false;
    try {
        db.update_item(item.id, patch);
    } catch (const kanban::conflict_error& e) {
        conflicted = true;
        assert(e.expected_version == 1);
        assert(e.actual_version == 2);
    }
    assert(conflicted);
    assert(db.get_item(item.id).title == "Login and signup");

    kanban::item_patch unversioned;
    unversioned.title = "No version";
    assert(throws<kanban::validation_error>([&] { db.update_item(item.id, unversioned); }));

    kanban::item_patch blank;
    blank.expected_version = 2;
    blank.title = "";
    assert(throws<kanban::validation_error>([&] { db.update_item(item.id, blank); }));

    kanban::item_patch negative;
    negative.expected_version = 2;
    negative.story_point = int64_t{-1};
    assert(throws<kanban::validation_error>([&] { db.update_item(item.id, negative); }));

    assert(throws<kanban::not_found_error>([&] { db.get_item(9999); }));
    assert(!db.find_item(9999));

    db.delete_item(item.id);
    assert(!db.find_item(item.id));
    assert(throws<kanban::not_found_error>([&] { db.delete_item(item.id); }));

    std::cout << "  Item CRUD test passed!" << std::endl;
}

void test_create_validation() {
    std::cout << "Testing create validation..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");

    assert(throws<kanban::validation_error>([&] { db.create_item({.project_id = "", .title = "x"}); }));
    assert(throws<kanban::validation_error>([&] { db.create_item({.project_id = "P", .title = ""}); }));
    assert(throws<kanban::not_found_error>([&] { db.create_item({.project_id = "ghost", .title = "x"}); }));
    assert(throws<kanban::validation_error>([&] {
        db.create_item({.project_id = "P", .title = "x", .status = item_status::done});
    }));
    assert(throws<kanban::validation_error>([&] {
        db.create_item({.project_id = "P", .title = "x", .estimate_value = -3});
    }));
    assert(throws<kanban::not_found_error>([&] {
        db.create_item({.project_id = "P", .title = "orphan", .parent_id = 4242});
    }));

    // Explicit Backlog is accepted
    auto item = db.create_item({.project_id = "P", .title = "ok", .status = item_status::backlog});
    assert(item.status == item_status::backlog);

    // Nothing from the rejected requests was written
    assert(db.list_items("P").size() == 1);
    assert(throws<kanban::validation_error>([&] { db.register_project(""); }));

    std::cout << "  Create validation test passed!" << std::endl;
}

void test_list_filters() {
    std::cout << "Testing list filters..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.register_project("Q");

    auto epic = db.create_item({.project_id = "P", .title = "Epic", .type = "epic"});
    auto s1 = db.create_item({.project_id = "P", .title = "S1", .type = "story", .parent_id = epic.id, .assignee_id = "ana"});
    auto s2 = db.create_item({.project_id = "P", .title = "S2", .type = "story", .parent_id = epic.id});
    auto t1 = db.create_item({.project_id = "P", .title = "T1", .assignee_id = "ana"});
    db.create_item({.project_id = "Q", .title = "Elsewhere"});
    db.transition(s2.id, item_status::todo);

    assert(db.list_items("P").size() == 4);
    assert(db.list_items("Q").size() == 1);
    assert(db.list_items("P", {.status = item_status::todo}).size() == 1);
    assert(db.list_items("P", {.assignee_id = "ana"}).size() == 2);
    assert(db.list_items("P", {.type = "story"}).size() == 2);
    assert(db.list_items("P", {.parent_id = epic.id}).size() == 2);

    kanban::item_filter roots;
    roots.roots_only = true;
    assert(db.list_items("P", roots).size() == 2);

    // Pagination walks the (status, rank) order
    auto all = db.list_items("P");
    assert(all.back().id == s2.id);
    kanban::item_filter page;
    page.limit = 2;
    auto first = db.list_items("P", page);
    page.offset = 2;
    auto second = db.list_items("P", page);
    assert(first.size() == 2 && second.size() == 2);
    assert(first[0].id == all[0].id && first[1].id == all[1].id);
    assert(second[0].id == all[2].id && second[1].id == all[3].id);
    assert(first[0].id == epic.id && first[1].id == s1.id && second[0].id == t1.id);

    assert(throws<kanban::not_found_error>([&] { db.list_items("ghost"); }));
    assert(throws<kanban::validation_error>([&] { db.list_items(""); }));

    std::cout << "  List filters test passed!" << std::endl;
}

// ============================================================================
// Test: Workflow state machine
// ============================================================================

void test_transition_graph() {
    std::cout << "Testing transition graph..." << std::endl;

    assert(kanban::is_legal_transition(item_status::backlog, item_status::todo));
    assert(kanban::is_legal_transition(item_status::todo, item_status::doing));
    assert(kanban::is_legal_transition(item_status::doing, item_status::done));
    assert(kanban::is_legal_transition(item_status::doing, item_status::todo));
    assert(kanban::is_legal_transition(item_status::todo, item_status::backlog));
    assert(kanban::is_legal_transition(item_status::done, item_status::doing));
    assert(!kanban::is_legal_transition(item_status::backlog, item_status::doing));
    assert(!kanban::is_legal_transition(item_status::backlog, item_status::done));
    assert(!kanban::is_legal_transition(item_status::done, item_status::backlog));
    assert(!kanban::is_legal_transition(item_status::done, item_status::todo));
    for (auto status : kanban::all_statuses) {
        assert(!kanban::is_legal_transition(status, status));
    }
    assert(kanban::legal_targets(item_status::todo).size() == 2);
    assert(kanban::legal_targets(item_status::done).size() == 1);

    assert(kanban::parse_status("doing") == item_status::doing);
    assert(kanban::parse_status("Done") == item_status::done);
    assert(!kanban::parse_status("Review"));

    std::cout << "  Transition graph test passed!" << std::endl;
}

void test_transitions() {
    std::cout << "Testing transitions..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    auto item = make_item(db, "P", "Ship it");

    bool rejected = false;
    try {
        db.transition(item.id, item_status::doing);
    } catch (const kanban::illegal_transition_error& e) {
        rejected = true;
        assert(e.current == item_status::backlog);
        assert(e.attempted == item_status::doing);
    }
    assert(rejected);
    assert(throws<kanban::illegal_transition_error>([&] { db.transition(item.id, item_status::backlog); }));
    assert(db.get_item(item.id).version == 1);

    auto todo = db.transition(item.id, item_status::todo);
    assert(todo.status == item_status::todo);
    assert(todo.version == 2);
    assert(!todo.started_at);

    auto doing = db.transition(item.id, item_status::doing);
    assert(doing.started_at);
    auto started = *doing.started_at;

    auto done = db.transition(item.id, item_status::done);
    assert(done.completed_at);
    assert(throws<kanban::illegal_transition_error>([&] { db.transition(item.id, item_status::todo); }));

    // Done is not terminal; reopening clears the completion stamp but keeps the first start
    auto reopened = db.transition(item.id, item_status::doing);
    assert(reopened.status == item_status::doing);
    assert(!reopened.completed_at);
    assert(reopened.started_at == started);

    // Round trip restores the status
    db.transition(item.id, item_status::todo);
    auto back = db.transition(item.id, item_status::doing);
    assert(back.status == item_status::doing);

    auto history = db.status_history(item.id);
    assert(history.size() == 7);
    assert(!history[0].from && history[0].to == item_status::backlog);
    assert(history[1].from == item_status::backlog && history[1].to == item_status::todo);
    assert(history[4].from == item_status::done && history[4].to == item_status::doing);
    for (size_t i = 1; i < history.size(); ++i) {
        assert(kanban::is_legal_transition(*history[i].from, history[i].to));
        assert(history[i - 1].changed_at <= history[i].changed_at);
    }

    assert(throws<kanban::not_found_error>([&] { db.transition(777, item_status::todo); }));

    std::cout << "  Transitions test passed!" << std::endl;
}

void test_parent_transition_leaves_children() {
    std::cout << "Testing parent transition without cascade..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    auto epic = make_item(db, "P", "Epic");
    auto child = make_item(db, "P", "Child", epic.id);

    advance_to(db, epic.id, item_status::done);
    assert(db.get_item(child.id).status == item_status::backlog);
    assert(db.get_item(child.id).parent_id == epic.id);

    std::cout << "  Parent transition test passed!" << std::endl;
}

// ============================================================================
// Test: WIP admission
// ============================================================================

void test_wip_limit_scenario() {
    std::cout << "Testing WIP limit scenario..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.set_wip_limit("P", item_status::doing, 2);

    auto a = make_item(db, "P", "A");
    auto b = make_item(db, "P", "B");
    auto c = make_item(db, "P", "C");
    advance_to(db, a.id, item_status::doing);
    advance_to(db, b.id, item_status::doing);
    db.transition(c.id, item_status::todo);

    bool denied = false;
    try {
        db.transition(c.id, item_status::doing);
    } catch (const kanban::wip_exceeded_error& e) {
        denied = true;
        assert(e.project_id == "P");
        assert(e.column == item_status::doing);
        assert(e.current_load == 2);
        assert(e.limit == 2);
        assert(e.incoming_weight == 1);
    }
    assert(denied);
    assert(db.get_item(c.id).status == item_status::todo);

    db.transition(a.id, item_status::done);
    auto admitted = db.transition(c.id, item_status::doing);
    assert(admitted.status == item_status::doing);

    // Leaving a full column is never gated
    db.transition(admitted.id, item_status::todo);
    assert(db.get_board("P").column(item_status::doing).load == 1);

    std::cout << "  WIP limit scenario test passed!" << std::endl;
}

void test_wip_limits_api() {
    std::cout << "Testing WIP limit API..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");

    auto initial = db.get_wip_limit("P", item_status::todo);
    assert(initial.is_unlimited());
    assert(initial.type == kanban::limit_type::hard);
    assert(db.get_wip_limit("P", item_status::backlog).is_unlimited());

    auto set = db.set_wip_limit("P", item_status::todo, 4);
    assert(set.limit == 4);
    assert(db.get_wip_limit("P", item_status::todo).limit == 4);

    db.set_wip_limit("P", item_status::todo, std::nullopt);
    assert(db.get_wip_limit("P", item_status::todo).is_unlimited());

    assert(throws<kanban::validation_error>([&] { db.set_wip_limit("P", item_status::backlog, 3); }));
    assert(throws<kanban::validation_error>([&] { db.set_wip_limit("P", item_status::done, 3); }));
    assert(throws<kanban::validation_error>([&] { db.set_wip_limit("P", item_status::doing, 0); }));
    assert(throws<kanban::validation_error>([&] { db.set_wip_limit("P", item_status::doing, -2); }));
    assert(throws<kanban::not_found_error>([&] { db.set_wip_limit("ghost", item_status::doing, 2); }));
    assert(throws<kanban::not_found_error>([&] { db.get_wip_limit("ghost", item_status::doing); }));

    std::cout << "  WIP limit API test passed!" << std::endl;
}

void test_wip_points_weighting() {
    std::cout << "Testing points-weighted WIP..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P", kanban::wip_weighting::points);
    db.set_wip_limit("P", item_status::doing, 5);

    auto big = db.create_item({.project_id = "P", .title = "Big", .story_point = 3});
    auto mid = db.create_item({.project_id = "P", .title = "Mid", .estimate_value = 2});
    auto unsized = db.create_item({.project_id = "P", .title = "Unsized"});
    advance_to(db, big.id, item_status::doing);
    advance_to(db, mid.id, item_status::doing);
    db.transition(unsized.id, item_status::todo);

    assert(db.get_board("P").column(item_status::doing).load == 5);
    bool denied = false;
    try {
        db.transition(unsized.id, item_status::doing);
    } catch (const kanban::wip_exceeded_error& e) {
        denied = true;
        assert(e.current_load == 5);
        assert(e.incoming_weight == 1);
    }
    assert(denied);

    // Growing an admitted item is admission-checked on the increase
    auto current = db.get_item(big.id);
    kanban::item_patch grow;
    grow.expected_version = current.version;
    grow.story_point = int64_t{4};
    assert(throws<kanban::wip_exceeded_error>([&] { db.update_item(big.id, grow); }));
    assert(db.get_item(big.id).story_point == 3);

    kanban::item_patch shrink;
    shrink.expected_version = current.version;
    shrink.story_point = int64_t{1};
    db.update_item(big.id, shrink);
    assert(db.get_board("P").column(item_status::doing).load == 3);
    db.transition(unsized.id, item_status::doing);
    assert(db.get_board("P").column(item_status::doing).load == 4);

    // Switching to count weighting
    db.set_wip_weighting("P", kanban::wip_weighting::count);
    assert(db.get_board("P").column(item_status::doing).load == 3);
    assert(throws<kanban::not_found_error>([&] { db.set_wip_weighting("ghost", kanban::wip_weighting::count); }));

    std::cout << "  Points-weighted WIP test passed!" << std::endl;
}

void test_wip_size_bounds() {
    std::cout << "Testing WIP size bounds..." << std::endl;

    constexpr int64_t huge = std::numeric_limits<int64_t>::max();

    kanban::kanban_db db;
    db.register_project("P", kanban::wip_weighting::points);
    db.set_wip_limit("P", item_status::doing, 2);

    auto a = db.create_item({.project_id = "P", .title = "A", .story_point = 1});
    advance_to(db, a.id, item_status::doing);

    assert(throws<kanban::validation_error>([&] {
        db.create_item({.project_id = "P", .title = "Huge", .story_point = huge});
    }));
    assert(throws<kanban::validation_error>([&] {
        db.create_item({.project_id = "P", .title = "Over", .estimate_value = kanban::max_item_size + 1});
    }));

    auto c = db.create_item({.project_id = "P", .title = "C", .story_point = kanban::max_item_size});
    db.transition(c.id, item_status::todo);

    bool denied = false;
    try {
        db.transition(c.id, item_status::doing);
    } catch (const kanban::wip_exceeded_error& e) {
        denied = true;
        assert(e.current_load == 1);
        assert(e.incoming_weight == kanban::max_item_size);
    }
    assert(denied);

    kanban::item_patch grow;
    grow.expected_version = db.get_item(c.id).version;
    grow.story_point = huge;
    assert(throws<kanban::validation_error>([&] { db.update_item(c.id, grow); }));

    // The admission sum must not wrap around for any incoming weight
    denied = false;
    try {
        db.check_admission("P", item_status::doing, huge);
    } catch (const kanban::wip_exceeded_error& e) {
        denied = true;
        assert(e.current_load == 1);
        assert(e.incoming_weight == huge);
    }
    assert(denied);

    auto doing = db.get_board("P").column(item_status::doing);
    assert(doing.items.size() == 1);
    assert(doing.load == 1);

    std::cout << "  WIP size bounds test passed!" << std::endl;
}

void test_pause() {
    std::cout << "Testing pause..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.set_wip_limit("P", item_status::doing, 1);

    auto a = make_item(db, "P", "A");
    auto b = make_item(db, "P", "B");
    advance_to(db, a.id, item_status::doing);
    db.transition(b.id, item_status::todo);

    // Pausing frees the slot at once
    auto paused = db.set_pause(a.id, true);
    assert(paused.pause);
    assert(db.get_board("P").column(item_status::doing).load == 0);
    db.transition(b.id, item_status::doing);

    // Resuming has to be admitted
    bool denied = false;
    try {
        db.set_pause(a.id, false);
    } catch (const kanban::wip_exceeded_error& e) {
        denied = true;
        assert(e.current_load == 1);
    }
    assert(denied);
    assert(db.get_item(a.id).pause);

    db.transition(b.id, item_status::done);
    auto resumed = db.set_pause(a.id, false);
    assert(!resumed.pause);

    // Paused items enter bounded columns without admission
    auto c = make_item(db, "P", "C");
    db.transition(c.id, item_status::todo);
    db.set_pause(c.id, true);
    db.transition(c.id, item_status::doing);
    assert(db.get_board("P").column(item_status::doing).load == 1);
    assert(db.flow_metrics("P").work_in_progress == 1);

    std::cout << "  Pause test passed!" << std::endl;
}

void test_soft_limits_and_usage() {
    std::cout << "Testing soft limits and usage..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.set_wip_limit("P", item_status::todo, 1, kanban::limit_type::soft);
    db.set_wip_limit("P", item_status::doing, 3);

    auto a = make_item(db, "P", "A");
    auto b = make_item(db, "P", "B");
    db.transition(a.id, item_status::todo);
    db.transition(b.id, item_status::todo);

    auto preview = db.check_admission("P", item_status::todo, 1);
    assert(preview.soft_overrun);
    assert(preview.load_before == 2);

    auto open = db.check_admission("P", item_status::doing, 1);
    assert(!open.soft_overrun);
    assert(open.limit == 3);

    auto usage = db.get_wip_usage("P");
    assert(usage.size() == 2);
    assert(usage[0].column == item_status::todo);
    assert(usage[0].load == 2);
    assert(usage[0].type == kanban::limit_type::soft);
    assert(usage[0].available == 0);
    assert(usage[1].column == item_status::doing);
    assert(usage[1].load == 0);
    assert(usage[1].available == 3);

    nlohmann::json preview_json = preview;
    assert(preview_json["column"] == "Todo");
    assert(preview_json["load_before"] == 2);
    assert(preview_json["incoming_weight"] == 1);
    assert(preview_json["limit"] == 1);
    assert(preview_json["soft_overrun"] == true);

    nlohmann::json soft = db.get_wip_limit("P", item_status::todo);
    assert(soft["project_id"] == "P");
    assert(soft["column"] == "Todo");
    assert(soft["limit"] == 1);
    assert(soft["limit_type"] == "soft");
    assert(soft["updated_at"].is_number());

    // Unlimited columns serialize limit and available as null
    nlohmann::json cleared = db.set_wip_limit("P", item_status::doing, std::nullopt);
    assert(cleared.contains("limit") && cleared["limit"].is_null());
    assert(cleared["limit_type"] == "hard");

    nlohmann::json report = db.get_wip_usage("P");
    assert(report.is_array() && report.size() == 2);
    assert(report[0]["column"] == "Todo");
    assert(report[0]["limit"] == 1);
    assert(report[0]["limit_type"] == "soft");
    assert(report[0]["load"] == 2);
    assert(report[0]["available"] == 0);
    assert(report[1]["column"] == "Doing");
    assert(report[1].contains("limit") && report[1]["limit"].is_null());
    assert(report[1]["load"] == 0);
    assert(report[1].contains("available") && report[1]["available"].is_null());

    nlohmann::json unbounded = db.check_admission("P", item_status::doing, 7);
    assert(unbounded["limit"].is_null());
    assert(unbounded["soft_overrun"] == false);

    std::cout << "  Soft limits and usage test passed!" << std::endl;
}

// ============================================================================
// Test: Hierarchy
// ============================================================================

void test_reparent_and_cycles() {
    std::cout << "Testing reparent and cycles..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.register_project("Q");
    auto a = make_item(db, "P", "A");
    auto b = make_item(db, "P", "B", a.id);
    auto c = make_item(db, "P", "C", b.id);
    auto outsider = make_item(db, "Q", "Outsider");

    // A under its own descendant
    bool cycle = false;
    try {
        db.reparent(a.id, c.id);
    } catch (const kanban::cycle_error& e) {
        cycle = true;
        assert(e.item_id == a.id);
        assert(e.parent_id == c.id);
    }
    assert(cycle);
    assert(!db.get_item(a.id).parent_id);
    assert(db.get_item(b.id).parent_id == a.id);
    assert(db.get_item(c.id).parent_id == b.id);

    assert(throws<kanban::cycle_error>([&] { db.reparent(a.id, a.id); }));
    assert(throws<kanban::cycle_error>([&] { db.reparent(a.id, b.id); }));
    assert(throws<kanban::cross_project_error>([&] { db.reparent(c.id, outsider.id); }));
    assert(throws<kanban::cross_project_error>([&] {
        db.create_item({.project_id = "P", .title = "Stray", .parent_id = outsider.id});
    }));
    assert(throws<kanban::not_found_error>([&] { db.reparent(c.id, 31337); }));

    // Legal moves
    auto moved = db.reparent(c.id, a.id);
    assert(moved.parent_id == a.id);
    auto root = db.reparent(b.id, std::nullopt);
    assert(!root.parent_id);
    auto under = db.reparent(a.id, b.id);
    assert(under.parent_id == b.id);

    auto activity = db.activity(a.id);
    assert(activity.back().kind == "reparent");
    auto changes = nlohmann::json::parse(activity.back().changes);
    assert(changes["parent_id"]["from"].is_null());
    assert(changes["parent_id"]["to"] == b.id);

    std::cout << "  Reparent and cycles test passed!" << std::endl;
}

void test_children_and_descendants() {
    std::cout << "Testing children and descendants..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    auto epic = make_item(db, "P", "Epic");
    auto s1 = make_item(db, "P", "S1", epic.id);
    auto s2 = make_item(db, "P", "S2", epic.id);
    auto t1 = make_item(db, "P", "T1", s1.id);
    db.transition(s1.id, item_status::todo);

    // (status, rank) order puts the Backlog child first
    auto children = db.children(epic.id);
    assert(children.size() == 2);
    assert(children[0].id == s2.id);
    assert(children[1].id == s1.id);

    auto range = db.descendants(epic.id);
    auto first = range.to_vector();
    assert(first.size() == 3);
    assert(first[0].id == s2.id);
    assert(first[1].id == s1.id);
    assert(first[2].id == t1.id);

    // Restarting the walk reflects new edges
    auto t2 = make_item(db, "P", "T2", s2.id);
    std::vector<kanban::item_id_t> second;
    for (const auto& item : range) {
        second.push_back(item.id);
    }
    assert(second.size() == 4);
    assert(second[0] == s2.id && second[1] == t2.id);

    assert(db.descendants(t1.id).to_vector().empty());
    assert(db.children(t1.id).empty());
    assert(throws<kanban::not_found_error>([&] { db.descendants(999); }));

    std::cout << "  Children and descendants test passed!" << std::endl;
}

void test_delete_policies() {
    std::cout << "Testing delete policies..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    auto parent = make_item(db, "P", "Parent");
    auto c1 = make_item(db, "P", "C1", parent.id);
    auto c2 = make_item(db, "P", "C2", parent.id);
    auto g1 = make_item(db, "P", "G1", c1.id);

    bool refused = false;
    try {
        db.delete_item(parent.id);
    } catch (const kanban::has_children_error& e) {
        refused = true;
        assert(e.child_count == 2);
    }
    assert(refused);
    assert(db.find_item(parent.id));

    db.delete_item(parent.id, kanban::delete_policy::detach_children);
    assert(!db.find_item(parent.id));
    assert(!db.get_item(c1.id).parent_id);
    assert(!db.get_item(c2.id).parent_id);
    assert(db.get_item(g1.id).parent_id == c1.id);

    // Cascade removes the whole subtree, leaves first
    auto top = make_item(db, "P", "Top");
    db.reparent(c1.id, top.id);
    db.delete_item(top.id, kanban::delete_policy::cascade_delete);
    assert(!db.find_item(top.id));
    assert(!db.find_item(c1.id));
    assert(!db.find_item(g1.id));
    assert(db.find_item(c2.id));
    assert(db.list_items("P").size() == 1);

    // History outlives the item
    auto trail = db.activity(g1.id);
    assert(trail.back().kind == "delete");
    assert(db.status_history(g1.id).size() == 1);

    std::cout << "  Delete policies test passed!" << std::endl;
}

// ============================================================================
// Test: Board projection
// ============================================================================

void test_board() {
    std::cout << "Testing board..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    db.set_wip_limit("P", item_status::doing, 4);

    auto epic = make_item(db, "P", "Epic");
    auto story = make_item(db, "P", "Story", epic.id);
    auto task = make_item(db, "P", "Task", story.id);
    auto todo1 = make_item(db, "P", "Todo 1");
    auto todo2 = make_item(db, "P", "Todo 2");
    auto doing = make_item(db, "P", "Doing");
    auto done = make_item(db, "P", "Done");
    db.transition(story.id, item_status::todo);
    db.transition(todo1.id, item_status::todo);
    db.transition(todo2.id, item_status::todo);
    advance_to(db, doing.id, item_status::doing);
    advance_to(db, done.id, item_status::done);

    auto board = db.get_board("P");
    assert(board.project_id == "P");

    std::set<kanban::item_id_t> seen;
    size_t total = 0;
    for (auto status : kanban::all_statuses) {
        const auto& column = board.column(status);
        assert(column.status == status);
        for (size_t i = 0; i < column.items.size(); ++i) {
            assert(column.items[i].item.status == status);
            if (i > 0) assert(column.items[i - 1].item.rank < column.items[i].item.rank);
            seen.insert(column.items[i].item.id);
            ++total;
        }
    }
    assert(total == 7);
    assert(seen.size() == 7);

    const auto& backlog = board.column(item_status::backlog);
    assert(backlog.items.size() == 2);
    assert(backlog.items[0].item.id == epic.id);
    assert(backlog.items[1].item.id == task.id);

    // Full subtree by default
    assert(backlog.items[0].children.size() == 1);
    assert(backlog.items[0].children[0].item.id == story.id);
    assert(backlog.items[0].children[0].children.size() == 1);
    assert(backlog.items[0].children[0].children[0].item.id == task.id);

    const auto& todo = board.column(item_status::todo);
    assert(todo.items.size() == 3);
    assert(todo.items[0].item.id == story.id);
    assert(todo.items[1].item.id == todo1.id);
    assert(todo.items[2].item.id == todo2.id);
    assert(todo.load == 3);
    assert(!todo.limit);

    const auto& in_progress = board.column(item_status::doing);
    assert(in_progress.limit == 4);
    assert(in_progress.load == 1);
    assert(board.column(item_status::done).items.size() == 1);

    // Serializes for the request layer
    nlohmann::json j = board;
    assert(j["columns"].size() == 4);
    assert(j["columns"][0]["status"] == "Backlog");
    assert(j["columns"][0]["items"][0]["children"][0]["title"] == "Story");

    assert(throws<kanban::not_found_error>([&] { db.get_board("ghost"); }));

    std::cout << "  Board test passed!" << std::endl;
}

void test_board_child_depth() {
    std::cout << "Testing board child depth..." << std::endl;

    kanban::configuration config;
    config.board_child_depth = 1;
    kanban::kanban_db db(config);
    db.register_project("P");
    auto epic = make_item(db, "P", "Epic");
    auto story = make_item(db, "P", "Story", epic.id);
    make_item(db, "P", "Task", story.id);

    auto board = db.get_board("P");
    const auto& root = board.column(item_status::backlog).items[0];
    assert(root.item.id == epic.id);
    assert(root.children.size() == 1);
    assert(root.children[0].children.empty());

    kanban::configuration flat;
    flat.board_child_depth = 0;
    kanban::kanban_db flat_db(flat);
    flat_db.register_project("P");
    auto parent = make_item(flat_db, "P", "Parent");
    make_item(flat_db, "P", "Child", parent.id);
    assert(flat_db.get_board("P").column(item_status::backlog).items[0].children.empty());

    std::cout << "  Board child depth test passed!" << std::endl;
}

// ============================================================================
// Test: Activity log, metrics, cancellation
// ============================================================================

void test_activity_log() {
    std::cout << "Testing activity log..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    kanban::operation_context ctx;
    ctx.actor_id = "ana";

    auto item = db.create_item({.project_id = "P", .title = "Draft"}, ctx);
    kanban::item_patch patch;
    patch.expected_version = item.version;
    patch.title = "Final";
    patch.assignee_id = std::string("ben");
    db.update_item(item.id, patch, ctx);
    db.transition(item.id, item_status::todo, std::nullopt, ctx);

    auto log = db.activity(item.id);
    assert(log.size() == 3);
    assert(log[0].kind == "create");
    assert(log[1].kind == "update");
    assert(log[2].kind == "transition");
    for (const auto& entry : log) {
        assert(entry.actor_id == "ana");
    }

    auto created = nlohmann::json::parse(log[0].changes);
    assert(created["title"]["from"].is_null());
    assert(created["title"]["to"] == "Draft");

    auto updated = nlohmann::json::parse(log[1].changes);
    assert(updated["title"]["from"] == "Draft");
    assert(updated["title"]["to"] == "Final");
    assert(updated["assignee_id"]["from"].is_null());
    assert(updated["assignee_id"]["to"] == "ben");
    assert(!updated.contains("story_point"));

    auto moved = nlohmann::json::parse(log[2].changes);
    assert(moved["status"]["from"] == "Backlog");
    assert(moved["status"]["to"] == "Todo");

    auto history = db.status_history(item.id);
    assert(history.back().actor_id == "ana");

    nlohmann::json entry = log[1];
    assert(entry["changes"]["title"]["to"] == "Final");
    assert(entry["kind"] == "update");
    assert(entry["item_id"] == item.id);
    assert(entry["project_id"] == "P");
    assert(entry["actor_id"] == "ana");
    assert(entry["created_at"].is_number());

    // The creation row has no source column
    nlohmann::json rows = history;
    assert(rows.size() == 2);
    assert(rows[0].contains("from") && rows[0]["from"].is_null());
    assert(rows[0]["to"] == "Backlog");
    assert(rows[0]["item_id"] == item.id);
    assert(rows[1]["from"] == "Backlog");
    assert(rows[1]["to"] == "Todo");
    assert(rows[1]["actor_id"] == "ana");
    assert(rows[1]["changed_at"].is_number());

    std::cout << "  Activity log test passed!" << std::endl;
}

void test_flow_metrics() {
    std::cout << "Testing flow metrics..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");

    auto empty = db.flow_metrics("P");
    assert(empty.total_completed == 0);
    assert(!empty.avg_cycle_time_hours);
    assert(!empty.avg_lead_time_hours);

    auto a = make_item(db, "P", "A");
    auto b = make_item(db, "P", "B");
    auto c = make_item(db, "P", "C");
    advance_to(db, a.id, item_status::done);
    advance_to(db, b.id, item_status::done);
    advance_to(db, c.id, item_status::doing);

    auto metrics = db.flow_metrics("P");
    assert(metrics.total_completed == 2);
    assert(metrics.throughput_per_week == 2);
    assert(metrics.work_in_progress == 1);
    assert(metrics.avg_cycle_time_hours && *metrics.avg_cycle_time_hours >= 0.0);
    assert(metrics.avg_lead_time_hours && *metrics.avg_lead_time_hours >= *metrics.avg_cycle_time_hours);

    // Completions older than a week drop out of throughput only
    auto later = db.flow_metrics("P", kanban::now_ms() + std::chrono::hours(24 * 8));
    assert(later.throughput_per_week == 0);
    assert(later.total_completed == 2);

    auto cycle = db.cycle_time(a.id);
    assert(cycle);
    assert(cycle->item_id == a.id);
    assert(cycle->completed_at >= cycle->started_at);
    assert(!db.cycle_time(c.id));

    nlohmann::json j = metrics;
    assert(j["total_completed"] == 2);

    assert(throws<kanban::not_found_error>([&] { db.flow_metrics("ghost"); }));

    std::cout << "  Flow metrics test passed!" << std::endl;
}

void test_cancellation() {
    std::cout << "Testing cancellation..." << std::endl;

    kanban::kanban_db db;
    db.register_project("P");
    auto item = make_item(db, "P", "Cancel me");

    std::stop_source source;
    source.request_stop();
    kanban::operation_context ctx;
    ctx.stop = source.get_token();

    assert(throws<kanban::cancelled_error>([&] { db.transition(item.id, item_status::todo, std::nullopt, ctx); }));
    auto unchanged = db.get_item(item.id);
    assert(unchanged.status == item_status::backlog);
    assert(unchanged.version == item.version);
    assert(db.status_history(item.id).size() == 1);
    assert(db.activity(item.id).size() == 1);

    assert(throws<kanban::cancelled_error>([&] {
        db.create_item({.project_id = "P", .title = "Never"}, ctx);
    }));
    assert(db.list_items("P").size() == 1);

    assert(throws<kanban::cancelled_error>([&] { db.reparent(item.id, make_item(db, "P", "Parent").id, ctx); }));
    assert(!db.get_item(item.id).parent_id);

    std::cout << "  Cancellation test passed!" << std::endl;
}

// ============================================================================
// Test: File database persistence
// ============================================================================

void test_file_database() {
    std::cout << "Testing file database..." << std::endl;

    auto path = std::filesystem::temp_directory_path() / ("kanban_test_" + std::to_string(getpid()) + ".db");
    auto cleanup = [&] {
        std::filesystem::remove(path);
        std::filesystem::remove(path.string() + "-wal");
        std::filesystem::remove(path.string() + "-shm");
    };
    cleanup();

    kanban::item_id_t id = 0;
    {
        kanban::kanban_db db(path.string());
        db.register_project("P");
        db.set_wip_limit("P", item_status::doing, 2);
        id = make_item(db, "P", "Persisted").id;
        db.transition(id, item_status::todo);
    }
    {
        kanban::kanban_db db(path.string());
        assert(db.store().db().user_version() == kanban::schema_version);
        auto item = db.get_item(id);
        assert(item.title == "Persisted");
        assert(item.status == item_status::todo);
        assert(db.get_wip_limit("P", item_status::doing).limit == 2);
        assert(db.status_history(id).size() == 2);
    }

    // A file written by a newer schema is refused
    {
        kanban::database raw(path.string());
        raw.set_user_version(kanban::schema_version + 1);
    }
    assert(throws<kanban::store_error>([&] { kanban::kanban_db db(path.string()); }));

    cleanup();
    std::cout << "  File database test passed!" << std::endl;
}

int main() {
    std::cout << "=== KanbanCore Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        // Ambient
        test_log_levels();
        test_configuration();

        // Item store
        test_item_crud();
        test_create_validation();
        test_list_filters();

        // Workflow
        test_transition_graph();
        test_transitions();
        test_parent_transition_leaves_children();

        // WIP admission
        test_wip_limit_scenario();
        test_wip_limits_api();
        test_wip_points_weighting();
        test_wip_size_bounds();
        test_pause();
        test_soft_limits_and_usage();

        // Ranks
        rank_tests::run_all();

        // Hierarchy
        test_reparent_and_cycles();
        test_children_and_descendants();
        test_delete_policies();

        // Board
        test_board();
        test_board_child_depth();

        // History, metrics, cancellation
        test_activity_log();
        test_flow_metrics();
        test_cancellation();

        // Persistence
        test_file_database();

        // Threads
        concurrency_tests::run_all();

        std::cout << std::endl;
        std::cout << "========================================" << std::endl;
        std::cout << "All tests passed!" << std::endl;
        std::cout << "========================================" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
