#include "kanban/rank.hpp"
#include "kanban/item_store.hpp"
#include "kanban/json.hpp"
#include "kanban/log.hpp"
#include <algorithm>

namespace kanban {

namespace rank_keys {

namespace {

constexpr int base = static_cast<int>(alphabet.size());

int digit_of(char c) {
    auto pos = alphabet.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

// Requires a < b, or b empty. Neither may end in the zero digit.
std::string midpoint(const std::string& a, const std::string& b) {
    if (!b.empty()) {
        // Shared prefix, with a padded by zero digits
        size_t n = 0;
        while (n < b.size() && (n < a.size() ? a[n] : alphabet[0]) == b[n]) {
            ++n;
        }
        if (n > 0) {
            return b.substr(0, n) + midpoint(a.substr(std::min(n, a.size())), b.substr(n));
        }
    }

    int da = a.empty() ? 0 : digit_of(a[0]);
    int db = b.empty() ? base : digit_of(b[0]);
    if (db - da > 1) {
        return std::string(1, alphabet[static_cast<size_t>((da + db) / 2)]);
    }
    if (b.size() > 1) {
        return b.substr(0, 1);
    }
    return std::string(1, alphabet[static_cast<size_t>(da)]) + midpoint(a.empty() ? std::string() : a.substr(1), std::string());
}

} // namespace

bool is_valid(const std::string& key) {
    if (key.empty() || key.back() == alphabet[0]) {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](char c) { return digit_of(c) >= 0; });
}

std::string between(const std::string& lower, const std::string& upper) {
    if (!lower.empty() && !is_valid(lower)) {
        throw validation_error("Invalid rank key '" + lower + "'");
    }
    if (!upper.empty() && !is_valid(upper)) {
        throw validation_error("Invalid rank key '" + upper + "'");
    }
    if (!lower.empty() && !upper.empty() && lower >= upper) {
        throw validation_error("Rank '" + lower + "' does not precede '" + upper + "'");
    }
    return midpoint(lower, upper);
}

std::vector<std::string> evenly_spaced(size_t count) {
    std::vector<std::string> keys;
    if (count == 0) return keys;
    keys.reserve(count);

    // Smallest width leaving at least two digits of room between neighbours
    constexpr size_t max_width = 10;
    constexpr uint64_t min_gap = static_cast<uint64_t>(base) * base;
    size_t width = 1;
    uint64_t space = base;
    while (width < max_width && space / (count + 1) < min_gap) {
        ++width;
        space *= base;
    }
    uint64_t step = std::max<uint64_t>(space / (count + 1), 1);

    for (size_t i = 1; i <= count; ++i) {
        uint64_t value = step * i;
        std::string key(width, alphabet[0]);
        for (size_t pos = width; pos-- > 0;) {
            key[pos] = alphabet[value % base];
            value /= base;
        }
        while (key.size() > 1 && key.back() == alphabet[0]) {
            key.pop_back();
        }
        keys.push_back(std::move(key));
    }
    return keys;
}

} // namespace rank_keys

// ============================================================================
// rank_sequencer
// ============================================================================

rank_sequencer::rank_sequencer(item_store& store, partition_locks& locks, size_t max_length)
    : store_(store), locks_(locks), max_length_(max_length) {}

std::string rank_sequencer::key_for(const std::vector<backlog_item>& items, const position_hint& hint) const {
    auto neighbours_after = [&](size_t index) {
        const auto& upper = index + 1 < items.size() ? items[index + 1].rank : std::string();
        return rank_keys::between(items[index].rank, upper);
    };

    switch (hint.where) {
        case position_hint::kind::start:
            return rank_keys::between("", items.empty() ? std::string() : items.front().rank);

        case position_hint::kind::after: {
            auto it = std::find_if(items.begin(), items.end(),
                                   [&](const backlog_item& i) { return i.id == hint.anchor; });
            if (it == items.end()) {
                throw not_found_error("Item " + std::to_string(hint.anchor.value_or(0)) +
                                      " is not in the destination column");
            }
            return neighbours_after(static_cast<size_t>(it - items.begin()));
        }

        case position_hint::kind::exact: {
            if (!rank_keys::is_valid(hint.key)) {
                throw validation_error("Invalid rank key '" + hint.key + "'");
            }
            auto it = std::find_if(items.begin(), items.end(),
                                   [&](const backlog_item& i) { return i.rank == hint.key; });
            if (it == items.end()) {
                return hint.key;
            }
            // Taken: the later writer goes directly after the holder
            return neighbours_after(static_cast<size_t>(it - items.begin()));
        }

        case position_hint::kind::end:
            break;
    }
    return rank_keys::between(items.empty() ? std::string() : items.back().rank, "");
}

std::string rank_sequencer::assign_rank(const project_id_t& project_id, item_status column,
                                        const position_hint& hint, std::optional<item_id_t> moving) {
    return store_.write([&] {
        auto load_neighbours = [&] {
            auto items = store_.column_items(project_id, column);
            if (moving) {
                items.erase(std::remove_if(items.begin(), items.end(),
                                           [&](const backlog_item& i) { return i.id == *moving; }),
                            items.end());
            }
            return items;
        };

        auto key = key_for(load_neighbours(), hint);
        if (key.size() <= max_length_ || hint.where == position_hint::kind::exact) {
            return key;
        }

        rebalance(project_id, column, moving);
        key = key_for(load_neighbours(), hint);
        if (key.size() > max_length_) {
            LOG_WARN("rank", "Key of length %zu in %s of '%s' is still above %zu after rebalancing",
                     key.size(), to_string(column), project_id.c_str(), max_length_);
        }
        return key;
    });
}

void rank_sequencer::rebalance(const project_id_t& project_id, item_status column,
                               std::optional<item_id_t> exclude) {
    store_.write([&] {
        auto items = store_.column_items(project_id, column);
        if (exclude) {
            items.erase(std::remove_if(items.begin(), items.end(),
                                       [&](const backlog_item& i) { return i.id == *exclude; }),
                        items.end());
        }

        auto keys = rank_keys::evenly_spaced(items.size());
        std::vector<std::pair<item_id_t, std::string>> ranks;
        ranks.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) {
            ranks.emplace_back(items[i].id, keys[i]);
        }
        store_.rewrite_ranks(project_id, column, ranks);
        LOG_INFO("rank", "Rebalanced %zu items in %s of '%s'", items.size(), to_string(column), project_id.c_str());
    });
}

std::optional<backlog_item> rank_sequencer::reorder(item_id_t item_id, item_status column,
                                                    std::optional<item_id_t> after,
                                                    const operation_context& ctx) {
    if (after && *after == item_id) {
        throw validation_error("Item " + std::to_string(item_id) + " cannot be placed after itself");
    }

    // The column is only known after a read; retry if the item moves meanwhile
    constexpr int max_attempts = 3;
    for (int attempt = 1;; ++attempt) {
        auto peek = store_.get(item_id);
        if (peek.status != column) {
            return std::nullopt;
        }
        auto guard = locks_.acquire({partition_key::column(peek.project_id, peek.status)});

        auto result = store_.write([&]() -> std::optional<backlog_item> {
            auto current = store_.get(item_id);
            if (current.status != peek.status) {
                return std::nullopt;
            }

            auto hint = after ? position_hint::after(*after) : position_hint::at_start();
            auto rank = assign_rank(current.project_id, current.status, hint, item_id);
            // Unchanged unless a rebalance parked the item meanwhile
            if (rank == current.rank && store_.get(item_id).rank == current.rank) {
                return current;
            }

            auto updated = store_.set_fields(item_id, {{"rank", rank}});
            change_set changes;
            changes.record("rank", current.rank, updated.rank);
            store_.append_activity(updated, "reorder", changes.dump(), ctx.actor_id);

            if (ctx.stop.stop_requested()) {
                throw cancelled_error("reorder of item " + std::to_string(item_id));
            }
            return updated;
        });

        if (result) {
            return result;
        }
        if (attempt >= max_attempts) {
            throw conflict_error(item_id, peek.version, store_.get(item_id).version);
        }
        LOG_DEBUG("rank", "Item %lld changed column during reorder, retrying", static_cast<long long>(item_id));
    }
}

} // namespace kanban
