#pragma once

#include <KanbanCore.hpp>
#include <atomic>
#include <cassert>
#include <iostream>
#include <set>
#include <thread>
#include <vector>

namespace concurrency_tests {

// ============================================================================
// test_concurrent_admission: racing transitions never overfill a column
// ============================================================================

void test_concurrent_admission() {
    std::cout << "  test_concurrent_admission..." << std::flush;

    kanban::kanban_db db;
    db.register_project("P");
    db.set_wip_limit("P", kanban::item_status::doing, 3);

    constexpr int contenders = 12;
    std::vector<kanban::item_id_t> ids;
    for (int i = 0; i < contenders; ++i) {
        auto item = db.create_item({.project_id = "P", .title = "Racer " + std::to_string(i)});
        db.transition(item.id, kanban::item_status::todo);
        ids.push_back(item.id);
    }

    std::atomic<int> admitted{0};
    std::atomic<int> denied{0};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> threads;
    for (auto id : ids) {
        threads.emplace_back([&db, &admitted, &denied, &unexpected, id] {
            try {
                db.transition(id, kanban::item_status::doing);
                admitted++;
            } catch (const kanban::wip_exceeded_error& e) {
                assert(e.limit == 3);
                assert(e.current_load == 3);
                denied++;
            } catch (const std::exception&) {
                unexpected++;
            }
        });
    }
    for (auto& t : threads) t.join();

    assert(unexpected == 0);
    assert(admitted == 3);
    assert(denied == contenders - 3);
    assert(db.list_items("P", {.status = kanban::item_status::doing}).size() == 3);
    assert(db.get_board("P").column(kanban::item_status::doing).load == 3);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_concurrent_reparent: opposing reparents cannot form a cycle
// ============================================================================

void test_concurrent_reparent() {
    std::cout << "  test_concurrent_reparent..." << std::flush;

    kanban::kanban_db db;
    db.register_project("P");
    auto x = db.create_item({.project_id = "P", .title = "X"});
    auto y = db.create_item({.project_id = "P", .title = "Y"});

    for (int round = 0; round < 50; ++round) {
        std::atomic<int> cycles{0};
        std::atomic<int> unexpected{0};
        auto attempt = [&](kanban::item_id_t child, kanban::item_id_t parent) {
            try {
                db.reparent(child, parent);
            } catch (const kanban::cycle_error&) {
                cycles++;
            } catch (const std::exception&) {
                unexpected++;
            }
        };

        std::thread first(attempt, x.id, y.id);
        std::thread second(attempt, y.id, x.id);
        first.join();
        second.join();

        assert(unexpected == 0);
        assert(cycles == 1);
        auto xs = db.get_item(x.id);
        auto ys = db.get_item(y.id);
        assert(!(xs.parent_id == y.id && ys.parent_id == x.id));
        assert(xs.parent_id.has_value() != ys.parent_id.has_value());

        db.reparent(x.id, std::nullopt);
        db.reparent(y.id, std::nullopt);
    }

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_board_snapshot_under_writes: readers never see a torn move
// ============================================================================

void test_board_snapshot_under_writes() {
    std::cout << "  test_board_snapshot_under_writes..." << std::flush;

    kanban::kanban_db db;
    db.register_project("P");
    constexpr size_t item_count = 8;
    std::vector<kanban::item_id_t> ids;
    for (size_t i = 0; i < item_count; ++i) {
        auto item = db.create_item({.project_id = "P", .title = "Card " + std::to_string(i)});
        db.transition(item.id, kanban::item_status::todo);
        ids.push_back(item.id);
    }

    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};
    std::thread reader([&] {
        while (!stop) {
            auto board = db.get_board("P");
            std::set<kanban::item_id_t> seen;
            size_t total = 0;
            for (const auto& column : board.columns) {
                for (const auto& node : column.items) {
                    seen.insert(node.item.id);
                    ++total;
                }
            }
            if (total != item_count || seen.size() != item_count) torn++;
        }
    });

    std::thread writer([&] {
        for (int round = 0; round < 20; ++round) {
            for (auto id : ids) db.transition(id, kanban::item_status::doing);
            for (auto id : ids) db.transition(id, kanban::item_status::todo);
        }
        stop = true;
    });

    writer.join();
    reader.join();
    assert(torn == 0);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_reorder_while_moving: a reorder lands in the column it names
// ============================================================================

void test_reorder_while_moving() {
    std::cout << "  test_reorder_while_moving..." << std::flush;

    kanban::kanban_db db;
    db.register_project("P");
    auto anchor = db.create_item({.project_id = "P", .title = "Anchor"});
    auto item = db.create_item({.project_id = "P", .title = "Moving"});
    db.transition(anchor.id, kanban::item_status::todo);
    db.transition(item.id, kanban::item_status::todo);

    std::atomic<bool> stop{false};
    std::atomic<int> misplaced{0};
    std::atomic<int> unexpected{0};

    std::thread mover([&] {
        for (int round = 0; round < 100; ++round) {
            try {
                db.transition(item.id, kanban::item_status::doing);
                db.transition(item.id, kanban::item_status::todo);
            } catch (const kanban::illegal_transition_error&) {
                // The reorder thread moved it back first
            } catch (const kanban::conflict_error&) {
                // Retries ran out under contention
            } catch (const std::exception&) {
                unexpected++;
            }
        }
        stop = true;
    });

    std::thread reorderer([&] {
        while (!stop) {
            try {
                auto placed = db.reorder(item.id, kanban::item_status::todo, anchor.id);
                if (placed.status != kanban::item_status::todo) misplaced++;
            } catch (const kanban::conflict_error&) {
                // Retries ran out under contention
            } catch (const std::exception&) {
                unexpected++;
            }
        }
    });

    mover.join();
    reorderer.join();
    assert(misplaced == 0);
    assert(unexpected == 0);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing concurrency..." << std::endl;
    test_concurrent_admission();
    test_concurrent_reparent();
    test_board_snapshot_under_writes();
    test_reorder_while_moving();
    std::cout << "  Concurrency tests passed!" << std::endl;
}

} // namespace concurrency_tests
