#include <FormFusion/date_time.hpp>

using namespace std::chrono;
using namespace FormFusion::date_time_detail;

// ============================================================================
// Dates
// ============================================================================

static_assert(parse_date("2024-02-29") == year_month_day{year(2024), month(2), day(29)});
static_assert(parse_date("1999-12-31") == year_month_day{year(1999), month(12), day(31)});

// Nonexistent dates
static_assert(!parse_date("2023-02-29"));
static_assert(!parse_date("2024-13-01"));
static_assert(!parse_date("2024-00-10"));
static_assert(!parse_date("2024-04-31"));

// Shape
static_assert(!parse_date("2024-2-29"));
static_assert(!parse_date("2024/02/29"));
static_assert(!parse_date("20240229"));
static_assert(!parse_date(""));

// ============================================================================
// Times
// ============================================================================

constexpr bool time_is(std::string_view s, int h, int m, int sec) {
    auto t = parse_time(s);
    return t && t->hours().count() == h && t->minutes().count() == m && t->seconds().count() == sec;
}

static_assert(time_is("13:05", 13, 5, 0));
static_assert(time_is("00:00:00", 0, 0, 0));
static_assert(time_is("23:59:59", 23, 59, 59));

static_assert(!parse_time("24:00"));
static_assert(!parse_time("12:60"));
static_assert(!parse_time("12:00:60"));
static_assert(!parse_time("1:00"));
static_assert(!parse_time("12-00"));
static_assert(!parse_time("12:00:0"));

// ============================================================================
// Date-times
// ============================================================================

static_assert(parse_date_time("2024-02-29T13:05")
              == local_days{year(2024) / 2 / 29} + hours(13) + minutes(5));
static_assert(parse_date_time("2024-02-29T13:05:59")
              == local_days{year(2024) / 2 / 29} + hours(13) + minutes(5) + seconds(59));

static_assert(!parse_date_time("2024-02-29 13:05"));
static_assert(!parse_date_time("2024-02-30T13:05"));
static_assert(!parse_date_time("2024-02-29T"));
