#pragma once
#include <array>
#include <stdexcept>
#include <string>
#include <utility>

namespace nanakshahi {

// Gregorian year minus epoch gives the Nanakshahi year; the epoch depends on
// which side of March 14 the date falls.
constexpr int EPOCH_ON_OR_AFTER_MID_MARCH = 1468;
constexpr int EPOCH_BEFORE_MID_MARCH = 1469;

constexpr int NEW_YEAR_MONTH = 3;   // March
constexpr int NEW_YEAR_DAY = 14;

// Supported Gregorian years (the uint16 range), and the Nanakshahi years that
// overlap it. Anything outside throws CalendarError(InvalidDate).
constexpr int MIN_GREGORIAN_YEAR = 0;
constexpr int MAX_GREGORIAN_YEAR = 65535;
constexpr int MIN_NANAKSHAHI_YEAR = MIN_GREGORIAN_YEAR - EPOCH_BEFORE_MID_MARCH;
constexpr int MAX_NANAKSHAHI_YEAR = MAX_GREGORIAN_YEAR - EPOCH_ON_OR_AFTER_MID_MARCH;

struct NanakshahiDate {
    int year{};
    int month{};  // 1..12, Chet = 1
    int day{};    // 1..31
    std::string month_name;
};

struct GregorianDate {
    int year{};
    int month{};  // 1..12
    int day{};    // 1..31
    std::string month_name;
};

enum class ErrorCode {
    InvalidDate,     // rejected by the Gregorian calendar
    InvalidMonth,    // Nanakshahi month outside 1..12
    InvalidDay,      // Nanakshahi day outside the month
    OffsetOverflow,  // day offset ran past the end of the year (internal defect)
};

const char* to_string(ErrorCode code);

class CalendarError : public std::runtime_error {
public:
    CalendarError(ErrorCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    ErrorCode code() const noexcept { return code_; }
private:
    ErrorCode code_;
};

enum class Language { English, Punjabi };

// Static month lengths (5 x 31 then 7 x 30, sum 365). A leap year extends
// Phaggan to 31 days; see days_in_month().
const std::array<int, 12>& month_lengths();

// Month names: Latin transliteration and Gurmukhi. "" outside 1..12.
const char* month_name_en(int m);
const char* month_name_pa(int m);
const char* month_name(int m, Language lang);

// 366 when the year's span (March 14 .. March 13) contains February 29.
int year_length(int nanakshahiYear);
bool is_leap_year(int nanakshahiYear);
int days_in_month(int nanakshahiYear, int m);

// Days elapsed since the most recent March 14; 0 on March 14 itself.
// Throws CalendarError(InvalidDate) for impossible dates or years outside
// MIN_GREGORIAN_YEAR..MAX_GREGORIAN_YEAR.
long days_since_new_year(int year, int month, int day);

// Walks the month table. Returns {month 1..12, day 1..31}. Throws
// CalendarError(OffsetOverflow) when offset >= yearLength.
std::pair<int, int> month_for_offset(long offset, int yearLength);

// month_name is filled in the requested script.
NanakshahiDate to_nanakshahi(int year, int month, int day, Language lang = Language::English);
GregorianDate to_gregorian(int year, int month, int day);

// Current local calendar date in Nanakshahi.
NanakshahiDate today(Language lang = Language::English);

} // namespace nanakshahi
