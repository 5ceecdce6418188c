#pragma once

#include <cstdint>
#include <cmath>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>

namespace kanban {

// Timestamp type, millisecond resolution once it has been through the store
using timestamp_t = std::chrono::system_clock::time_point;

// Primary key of a backlog item
using item_id_t = int64_t;

// Project and user identities are owned by the request layer and treated as opaque text
using project_id_t = std::string;
using user_id_t = std::string;

/// Current wall-clock time truncated to milliseconds, the precision timestamps are stored at.
inline timestamp_t now_ms() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

/// Random v4 UUID, lowercase hyphenated. Used as an item's external global_id.
inline std::string make_global_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::array<uint8_t, 16> bytes{};
    for (size_t half = 0; half < 2; ++half) {
        uint64_t word = gen();
        for (size_t i = 0; i < 8; ++i) {
            bytes[half * 8 + i] = static_cast<uint8_t>(word >> (i * 8));
        }
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);

    static constexpr char hex[] = "0123456789abcdef";
    std::string text;
    text.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) text += '-';
        text += hex[bytes[i] >> 4];
        text += hex[bytes[i] & 0x0F];
    }
    return text;
}

// Supported column types
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

enum class column_type {
    integer,
    real,
    text
};

struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
    std::optional<std::string> default_sql;
};

struct index_def {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
};

struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    std::vector<index_def> indexes;
    bool autoincrement_id = true;  // If false, the table declares its own key columns
    std::vector<std::string> primary_key;
};

// ============================================================================
// Conversion between C++ field types and column values
// ============================================================================

namespace detail {
    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const char* v) { return std::string(v); }
    // Timestamps are stored as REAL seconds since epoch
    inline column_value_t to_column_value(timestamp_t v) {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
        return static_cast<double>(millis) / 1000.0;
    }

    template<typename T>
    column_value_t to_column_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_column_value(*v);
    }

    template<typename T>
    T from_column_value(const column_value_t& v);

    template<> inline int64_t from_column_value<int64_t>(const column_value_t& v) {
        if (std::holds_alternative<double>(v)) return static_cast<int64_t>(std::get<double>(v));
        return std::get<int64_t>(v);
    }
    template<> inline int from_column_value<int>(const column_value_t& v) {
        return static_cast<int>(from_column_value<int64_t>(v));
    }
    template<> inline bool from_column_value<bool>(const column_value_t& v) {
        return from_column_value<int64_t>(v) != 0;
    }
    template<> inline double from_column_value<double>(const column_value_t& v) {
        if (std::holds_alternative<int64_t>(v)) return static_cast<double>(std::get<int64_t>(v));
        return std::get<double>(v);
    }
    template<> inline std::string from_column_value<std::string>(const column_value_t& v) {
        return std::get<std::string>(v);
    }
    template<> inline timestamp_t from_column_value<timestamp_t>(const column_value_t& v) {
        double seconds = from_column_value<double>(v);
        auto millis = static_cast<int64_t>(std::llround(seconds * 1000.0));
        return timestamp_t(std::chrono::milliseconds(millis));
    }

    template<typename T>
    std::optional<T> optional_from_column_value(const column_value_t& v) {
        if (std::holds_alternative<std::nullptr_t>(v)) return std::nullopt;
        return from_column_value<T>(v);
    }
} // namespace detail

} // namespace kanban
