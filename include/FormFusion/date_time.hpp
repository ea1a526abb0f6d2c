#pragma once
#include <chrono>
#include <optional>
#include <string_view>

#include "static_schema.hpp"

namespace FormFusion {

using Date     = std::chrono::year_month_day;
using Time     = std::chrono::hh_mm_ss<std::chrono::seconds>;
using DateTime = std::chrono::local_seconds;

namespace date_time_detail {

constexpr std::optional<unsigned> digits(std::string_view s, std::size_t pos, std::size_t count) {
    if(pos + count > s.size()) return std::nullopt;
    unsigned v = 0;
    for(std::size_t i = pos; i < pos + count; i ++) {
        if(s[i] < '0' || s[i] > '9') return std::nullopt;
        v = v * 10 + static_cast<unsigned>(s[i] - '0');
    }
    return v;
}

/// `YYYY-MM-DD`, rejecting dates that do not exist.
constexpr std::optional<Date> parse_date(std::string_view s) {
    if(s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;
    auto y = digits(s, 0, 4);
    auto m = digits(s, 5, 2);
    auto d = digits(s, 8, 2);
    if(!y || !m || !d) return std::nullopt;
    Date date{std::chrono::year(static_cast<int>(*y)), std::chrono::month(*m), std::chrono::day(*d)};
    if(!date.ok()) return std::nullopt;
    return date;
}

/// `HH:MM` or `HH:MM:SS`.
constexpr std::optional<Time> parse_time(std::string_view s) {
    if((s.size() != 5 && s.size() != 8) || s[2] != ':') return std::nullopt;
    auto h = digits(s, 0, 2);
    auto m = digits(s, 3, 2);
    std::optional<unsigned> sec = 0u;
    if(s.size() == 8) {
        if(s[5] != ':') return std::nullopt;
        sec = digits(s, 6, 2);
    }
    if(!h || !m || !sec) return std::nullopt;
    if(*h > 23 || *m > 59 || *sec > 59) return std::nullopt;
    return Time(std::chrono::hours(*h) + std::chrono::minutes(*m) + std::chrono::seconds(*sec));
}

/// Date and time joined by `T`: `2024-02-29T13:05` or `2024-02-29T13:05:59`.
constexpr std::optional<DateTime> parse_date_time(std::string_view s) {
    std::size_t t = s.find('T');
    if(t == std::string_view::npos) return std::nullopt;
    auto date = parse_date(s.substr(0, t));
    auto time = parse_time(s.substr(t + 1));
    if(!date || !time) return std::nullopt;
    return std::chrono::local_days(*date) + time->to_duration();
}

} // namespace date_time_detail

template<>
struct FieldParser<Date> {
    static BindResult<Date> from_value(const ValueField& f) {
        if(auto d = date_time_detail::parse_date(f.value)) return *d;
        return Error::conversion("invalid date, expected YYYY-MM-DD");
    }
};

template<>
struct FieldParser<Time> {
    static BindResult<Time> from_value(const ValueField& f) {
        if(auto t = date_time_detail::parse_time(f.value)) return *t;
        return Error::conversion("invalid time, expected HH:MM or HH:MM:SS");
    }
};

template<>
struct FieldParser<DateTime> {
    static BindResult<DateTime> from_value(const ValueField& f) {
        if(auto dt = date_time_detail::parse_date_time(f.value)) return *dt;
        return Error::conversion("invalid date-time, expected YYYY-MM-DDTHH:MM[:SS]");
    }
};

} // namespace FormFusion
