#include "kanban/locks.hpp"
#include <algorithm>

namespace kanban {

std::shared_ptr<std::mutex> partition_locks::mutex_for(const partition_key& key) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto& slot = mutexes_[key];
    if (!slot) {
        slot = std::make_shared<std::mutex>();
    }
    return slot;
}

partition_locks::guard partition_locks::acquire(std::vector<partition_key> keys) {
    std::sort(keys.begin(), keys.end());
    keys.erase(std::unique(keys.begin(), keys.end()), keys.end());

    guard g;
    g.held_.reserve(keys.size());
    for (const auto& key : keys) {
        // Registry entries are never erased, so the raw mutex outlives the guard
        auto m = mutex_for(key);
        g.held_.emplace_back(*m);
    }
    return g;
}

} // namespace kanban
