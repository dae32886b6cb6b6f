#include "gregorian.hpp"

// Day-number conversions follow Howard Hinnant's civil calendar algorithms
// (http://howardhinnant.github.io/date_algorithms.html): March-based years,
// 400-year eras of 146097 days.

namespace gregorian {

std::optional<CivilDate> make_date(int year, int month, int day){
    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > last_day_of_month(year, month)) return std::nullopt;
    return CivilDate{year, month, day};
}

long days_from_civil(const CivilDate& date){
    long y = static_cast<long>(date.year) - (date.month <= 2);
    const long era = (y >= 0 ? y : y-399) / 400;
    const long yoe = y - era * 400;                                       // [0, 399]
    const long doy = (153*(date.month + (date.month > 2 ? -3 : 9)) + 2)/5 + date.day-1;  // [0, 365]
    const long doe = yoe * 365 + yoe/4 - yoe/100 + doy;                   // [0, 146096]
    return era * 146097 + doe - 719468;
}

CivilDate civil_from_days(long z){
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;                                   // [0, 146096]
    const long yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;    // [0, 399]
    const long doy = doe - (365*yoe + yoe/4 - yoe/100);                  // [0, 365]
    const long mp = (5*doy + 2)/153;                                     // [0, 11]
    const int d = static_cast<int>(doy - (153*mp+2)/5 + 1);              // [1, 31]
    const int m = static_cast<int>(mp < 10 ? mp+3 : mp-9);               // [1, 12]
    return CivilDate{static_cast<int>(yoe + era * 400 + (m <= 2)), m, d};
}

long days_between(const CivilDate& from, const CivilDate& to){
    return days_from_civil(to) - days_from_civil(from);
}

CivilDate add_days(const CivilDate& date, long days){
    return civil_from_days(days_from_civil(date) + days);
}

bool is_leap_year(int year){
    return (year%4==0 && year%100!=0) || (year%400==0);
}

// Preconditions: month is in [1, 12]
int last_day_of_month(int year, int month){
    static const int mdays[] = {31,28,31,30,31,30,31,31,30,31,30,31};
    return (month == 2 && is_leap_year(year)) ? 29 : mdays[month-1];
}

const char* month_name(int m){
    static const char* N[12] = {"January","February","March","April","May","June","July","August","September","October","November","December"};
    if (m < 1 || m > 12) return ""; return N[m-1];
}

} // namespace gregorian
