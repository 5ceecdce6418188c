#pragma once

#include "model.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// ============================================================================
// nlohmann::json ADL serialization for kanban types
// ============================================================================

// timestamp_t is a std type, so it needs adl_serializer rather than a free to_json
namespace nlohmann {
template <>
struct adl_serializer<kanban::timestamp_t> {
    static void to_json(json& j, const kanban::timestamp_t& t) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
        j = static_cast<double>(millis) / 1000.0;
    }

    static void from_json(const json& j, kanban::timestamp_t& t) {
        auto millis = static_cast<int64_t>(std::llround(j.get<double>() * 1000.0));
        t = kanban::timestamp_t(std::chrono::milliseconds(millis));
    }
};
} // namespace nlohmann

namespace kanban {

void to_json(nlohmann::json& j, item_status status);
void from_json(const nlohmann::json& j, item_status& status);

void to_json(nlohmann::json& j, const backlog_item& item);
void to_json(nlohmann::json& j, const wip_limit& limit);
void to_json(nlohmann::json& j, const wip_usage& usage);
void to_json(nlohmann::json& j, const admission& result);
void to_json(nlohmann::json& j, const status_change& change);
void to_json(nlohmann::json& j, const activity_entry& entry);
void to_json(nlohmann::json& j, const flow_summary& summary);
void to_json(nlohmann::json& j, const board_node& node);
void to_json(nlohmann::json& j, const board_column& column);
void to_json(nlohmann::json& j, const kanban_board& board);

/// Writes `value` under `key`, or null when empty.
template<typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

// ============================================================================
// change_set - the {field: {"from": .., "to": ..}} payload of an activity row
// ============================================================================

class change_set {
public:
    change_set() : fields_(nlohmann::json::object()) {}

    template<typename T>
    change_set& record(const char* field, const T& from, const T& to) {
        if (from == to) return *this;
        nlohmann::json entry = nlohmann::json::object();
        assign(entry["from"], from);
        assign(entry["to"], to);
        fields_[field] = std::move(entry);
        return *this;
    }

    /// Records a field with no prior value (creation).
    template<typename T>
    change_set& set(const char* field, const T& value) {
        nlohmann::json entry = nlohmann::json::object();
        entry["from"] = nullptr;
        assign(entry["to"], value);
        fields_[field] = std::move(entry);
        return *this;
    }

    bool empty() const { return fields_.empty(); }
    std::string dump() const { return fields_.dump(); }
    const nlohmann::json& fields() const { return fields_; }

private:
    template<typename T>
    static void assign(nlohmann::json& slot, const T& value) {
        slot = value;
    }

    template<typename T>
    static void assign(nlohmann::json& slot, const std::optional<T>& value) {
        if (value) {
            slot = *value;
        } else {
            slot = nullptr;
        }
    }

    nlohmann::json fields_;
};

} // namespace kanban
