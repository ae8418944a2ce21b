#include "tideline/realtime.hpp"

namespace tideline {

const char* to_string(channel_status status) noexcept {
    switch (status) {
        case channel_status::subscribed: return "subscribed";
        case channel_status::timed_out: return "timed_out";
        case channel_status::channel_error: return "channel_error";
        case channel_status::closed: return "closed";
    }
    return "unknown";
}

std::optional<channel_filter> channel_filter::parse(std::string_view text) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return std::nullopt;
    }
    return channel_filter{std::string(text.substr(0, eq)), std::string(text.substr(eq + 1))};
}

bool channel_filter::matches(const record& row) const {
    if (!row.is_object()) return false;
    auto it = row.find(column);
    if (it == row.end()) return false;
    if (it->is_string()) {
        return it->get<std::string>() == value;
    }
    return it->dump() == value;
}

} // namespace tideline
