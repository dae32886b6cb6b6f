#include "nanakshahi.hpp"
#include "gregorian.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

namespace nanakshahi {

static const std::array<int, 12> kMonthLengths = {31,31,31,31,31,30,30,30,30,30,30,30};

static bool on_or_after_new_year(int month, int day){
    return month > NEW_YEAR_MONTH || (month == NEW_YEAR_MONTH && day >= NEW_YEAR_DAY);
}

// March 14 is valid in every year, no need to go through make_date
static gregorian::CivilDate new_year_of(int gregorianYear){
    return gregorian::CivilDate{gregorianYear, NEW_YEAR_MONTH, NEW_YEAR_DAY};
}

static void check_year(int year, int lo, int hi, const char* calendar){
    if (year >= lo && year <= hi) return;
    char buf[96]; std::snprintf(buf, sizeof(buf), "%s year %d outside %d..%d", calendar, year, lo, hi);
    throw CalendarError(ErrorCode::InvalidDate, buf);
}

const char* to_string(ErrorCode code){
    switch (code) {
        case ErrorCode::InvalidDate: return "InvalidDate";
        case ErrorCode::InvalidMonth: return "InvalidMonth";
        case ErrorCode::InvalidDay: return "InvalidDay";
        case ErrorCode::OffsetOverflow: return "OffsetOverflow";
    }
    return "Unknown";
}

const std::array<int, 12>& month_lengths(){
    return kMonthLengths;
}

const char* month_name_en(int m){
    static const char* N[12] = {"Chet","Vaisakh","Jeth","Harh","Sawan","Bhadon","Assu","Kattak","Maghar","Poh","Magh","Phaggan"};
    if (m < 1 || m > 12) return ""; return N[m-1];
}
const char* month_name_pa(int m){
    static const char* N[12] = {"ਚੇਤ","ਵੈਸਾਖ","ਜੇਠ","ਹਾੜ","ਸਾਵਣ","ਭਾਦੋਂ","ਅੱਸੂ","ਕੱਤਕ","ਮੱਘਰ","ਪੋਹ","ਮਾਘ","ਫੱਗਣ"};
    if (m < 1 || m > 12) return ""; return N[m-1];
}
const char* month_name(int m, Language lang){
    return lang == Language::Punjabi ? month_name_pa(m) : month_name_en(m);
}

int year_length(int nanakshahiYear){
    check_year(nanakshahiYear, MIN_NANAKSHAHI_YEAR, MAX_NANAKSHAHI_YEAR, "Nanakshahi");
    int g = nanakshahiYear + EPOCH_ON_OR_AFTER_MID_MARCH;
    return static_cast<int>(gregorian::days_between(new_year_of(g), new_year_of(g + 1)));
}

bool is_leap_year(int nanakshahiYear){
    return year_length(nanakshahiYear) == 366;
}

int days_in_month(int nanakshahiYear, int m){
    check_year(nanakshahiYear, MIN_NANAKSHAHI_YEAR, MAX_NANAKSHAHI_YEAR, "Nanakshahi");
    if (m < 1 || m > 12) {
        char buf[64]; std::snprintf(buf, sizeof(buf), "invalid Nanakshahi month %d", m);
        throw CalendarError(ErrorCode::InvalidMonth, buf);
    }
    int len = kMonthLengths[m-1];
    if (m == 12 && is_leap_year(nanakshahiYear)) len += 1;
    return len;
}

long days_since_new_year(int year, int month, int day){
    check_year(year, MIN_GREGORIAN_YEAR, MAX_GREGORIAN_YEAR, "Gregorian");
    auto date = gregorian::make_date(year, month, day);
    if (!date) {
        char buf[64]; std::snprintf(buf, sizeof(buf), "invalid Gregorian date %04d-%02d-%02d", year, month, day);
        throw CalendarError(ErrorCode::InvalidDate, buf);
    }
    int refYear = on_or_after_new_year(month, day) ? year : year - 1;
    return gregorian::days_between(new_year_of(refYear), *date);
}

std::pair<int, int> month_for_offset(long offset, int yearLength){
    long remaining = offset;
    if (remaining >= 0) {
        for (int i=0;i<12;i++){
            long len = kMonthLengths[i];
            if (i == 11 && yearLength > 365) len += 1;
            if (remaining < len) return {i + 1, static_cast<int>(remaining) + 1};
            remaining -= len;
        }
    }
    char buf[96]; std::snprintf(buf, sizeof(buf), "day offset %ld outside a %d-day Nanakshahi year", offset, yearLength);
    std::cerr << "nanakshahi: internal error: " << buf << "\n";
    throw CalendarError(ErrorCode::OffsetOverflow, buf);
}

NanakshahiDate to_nanakshahi(int year, int month, int day, Language lang){
    long offset = days_since_new_year(year, month, day);
    int epoch = on_or_after_new_year(month, day) ? EPOCH_ON_OR_AFTER_MID_MARCH : EPOCH_BEFORE_MID_MARCH;
    NanakshahiDate n;
    n.year = year - epoch;
    auto md = month_for_offset(offset, year_length(n.year));
    n.month = md.first;
    n.day = md.second;
    n.month_name = month_name(n.month, lang);
    return n;
}

GregorianDate to_gregorian(int year, int month, int day){
    int dim = days_in_month(year, month);
    if (day < 1 || day > dim) {
        char buf[96]; std::snprintf(buf, sizeof(buf), "invalid day %d for %s (1..%d)", day, month_name_en(month), dim);
        throw CalendarError(ErrorCode::InvalidDay, buf);
    }
    long offset = day - 1;
    for (int i=0;i<month-1;i++) offset += kMonthLengths[i];
    gregorian::CivilDate g = gregorian::add_days(new_year_of(year + EPOCH_ON_OR_AFTER_MID_MARCH), offset);
    return GregorianDate{g.year, g.month, g.day, gregorian::month_name(g.month)};
}

NanakshahiDate today(Language lang){
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm lt{};
#if defined(_WIN32)
    localtime_s(&lt, &t);
#else
    localtime_r(&t, &lt);
#endif
    return to_nanakshahi(lt.tm_year + 1900, lt.tm_mon + 1, lt.tm_mday, lang);
}

} // namespace nanakshahi
