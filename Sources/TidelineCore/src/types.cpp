#include "tideline/types.hpp"
#include <cctype>
#include <cstdio>

namespace tideline {

const char* to_string(operation_kind kind) noexcept {
    switch (kind) {
        case operation_kind::create: return "create";
        case operation_kind::update: return "update";
        case operation_kind::remove: return "delete";
    }
    return "unknown";
}

const char* to_string(change_kind kind) noexcept {
    switch (kind) {
        case change_kind::insert: return "insert";
        case change_kind::update: return "update";
        case change_kind::remove: return "delete";
    }
    return "unknown";
}

std::optional<operation_kind> parse_operation_kind(std::string_view name) {
    if (name == "create") return operation_kind::create;
    if (name == "update") return operation_kind::update;
    if (name == "delete") return operation_kind::remove;
    return std::nullopt;
}

std::optional<change_kind> parse_change_kind(std::string_view name) {
    if (name == "insert" || name == "INSERT") return change_kind::insert;
    if (name == "update" || name == "UPDATE") return change_kind::update;
    if (name == "delete" || name == "DELETE") return change_kind::remove;
    return std::nullopt;
}

// ============================================================================
// ISO-8601
// ============================================================================

std::string format_timestamp(timestamp_t t) {
    using namespace std::chrono;
    auto ms_point = time_point_cast<milliseconds>(t);
    auto day_point = floor<days>(ms_point);
    year_month_day ymd{day_point};
    hh_mm_ss<milliseconds> tod{ms_point - day_point};

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()),
                  static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()),
                  static_cast<int>(tod.subseconds().count()));
    return buf;
}

namespace {

bool read_digits(std::string_view text, size_t& pos, size_t count, int& out) {
    if (pos + count > text.size()) return false;
    int value = 0;
    for (size_t i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + (c - '0');
    }
    pos += count;
    out = value;
    return true;
}

bool expect(std::string_view text, size_t& pos, char c) {
    if (pos >= text.size() || text[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::optional<timestamp_t> parse_timestamp(std::string_view text) {
    using namespace std::chrono;

    size_t pos = 0;
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
    if (!read_digits(text, pos, 4, y) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, mo) || !expect(text, pos, '-') ||
        !read_digits(text, pos, 2, d)) {
        return std::nullopt;
    }
    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        return std::nullopt;
    }
    ++pos;
    if (!read_digits(text, pos, 2, h) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, mi) || !expect(text, pos, ':') ||
        !read_digits(text, pos, 2, s)) {
        return std::nullopt;
    }

    // Fractional seconds: keep millisecond precision, ignore the rest.
    int millis = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    int offset_minutes = 0;
    if (pos < text.size()) {
        char z = text[pos];
        if (z == 'Z' || z == 'z') {
            ++pos;
        } else if (z == '+' || z == '-') {
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(text, pos, 2, oh)) return std::nullopt;
            if (pos < text.size() && text[pos] == ':') ++pos;
            if (!read_digits(text, pos, 2, om)) return std::nullopt;
            offset_minutes = (oh * 60 + om) * (z == '+' ? 1 : -1);
        } else {
            return std::nullopt;
        }
    }
    if (pos != text.size()) return std::nullopt;

    year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
    if (!ymd.ok() || h > 23 || mi > 59 || s > 60) return std::nullopt;

    auto tp = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} + milliseconds{millis}
              - minutes{offset_minutes};
    return time_point_cast<system_clock::duration>(tp);
}

std::optional<std::string> record_id_of(const record& row) {
    if (!row.is_object()) return std::nullopt;
    auto it = row.find("id");
    if (it == row.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    return std::nullopt;
}

std::optional<timestamp_t> record_modified_at(const record& row) {
    if (!row.is_object()) return std::nullopt;
    auto it = row.find("updated_at");
    if (it == row.end()) return std::nullopt;
    if (it->is_string()) return parse_timestamp(it->get<std::string>());
    if (it->is_number_integer()) {
        return timestamp_t{std::chrono::milliseconds{it->get<int64_t>()}};
    }
    return std::nullopt;
}

} // namespace tideline
