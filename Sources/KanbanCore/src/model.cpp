#include "kanban/model.hpp"
#include "kanban/errors.hpp"
#include <algorithm>
#include <cctype>

namespace kanban {

namespace {

std::string lowercase(const std::string& text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const char* to_string(item_status status) {
    switch (status) {
        case item_status::backlog: return "Backlog";
        case item_status::todo: return "Todo";
        case item_status::doing: return "Doing";
        case item_status::done: return "Done";
    }
    return "Backlog";
}

std::optional<item_status> parse_status(const std::string& text) {
    auto lower = lowercase(text);
    for (auto status : all_statuses) {
        if (lower == lowercase(to_string(status))) {
            return status;
        }
    }
    return std::nullopt;
}

const char* to_string(wip_weighting weighting) {
    return weighting == wip_weighting::points ? "points" : "count";
}

std::optional<wip_weighting> parse_weighting(const std::string& text) {
    auto lower = lowercase(text);
    if (lower == "count") return wip_weighting::count;
    if (lower == "points") return wip_weighting::points;
    return std::nullopt;
}

const char* to_string(limit_type type) {
    return type == limit_type::soft ? "soft" : "hard";
}

std::optional<limit_type> parse_limit_type(const std::string& text) {
    auto lower = lowercase(text);
    if (lower == "hard") return limit_type::hard;
    if (lower == "soft") return limit_type::soft;
    return std::nullopt;
}

illegal_transition_error::illegal_transition_error(item_id_t item, item_status from, item_status to)
    : kanban_error("Cannot move item " + std::to_string(item) + " from " + to_string(from) +
                   " to " + to_string(to))
    , item_id(item), current(from), attempted(to) {}

wip_exceeded_error::wip_exceeded_error(const project_id_t& project, item_status col,
                                       int64_t load, int64_t incoming, int64_t lim)
    : kanban_error("WIP limit reached for " + std::string(to_string(col)) + " in project '" + project +
                   "': load " + std::to_string(load) + " + " + std::to_string(incoming) +
                   " exceeds limit " + std::to_string(lim))
    , project_id(project), column(col), current_load(load), incoming_weight(incoming), limit(lim) {}

} // namespace kanban
