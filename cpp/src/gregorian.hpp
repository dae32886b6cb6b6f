#pragma once
#include <optional>

namespace gregorian {

struct CivilDate {
    int year{};
    int month{};  // 1..12
    int day{};    // 1..31
};

// Build a proleptic Gregorian date. Returns std::nullopt for impossible
// combinations such as 2025-02-30 or month 13.
std::optional<CivilDate> make_date(int year, int month, int day);

// Serial day number, 0 = 1970-01-01. Pure integer arithmetic, no time zone.
long days_from_civil(const CivilDate& date);
CivilDate civil_from_days(long z);

// Whole days from `from` to `to` (negative when `to` is earlier).
long days_between(const CivilDate& from, const CivilDate& to);

// Calendar-correct addition, crossing month and year boundaries.
CivilDate add_days(const CivilDate& date, long days);

bool is_leap_year(int year);
int last_day_of_month(int year, int month);

// English month name, "" outside 1..12
const char* month_name(int m);

} // namespace gregorian
