#include "time_utils.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    std::stringstream ss;

    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

long long current_epoch_seconds() {
    return time_point_to_epoch_seconds(std::chrono::system_clock::now());
}

std::string format_epoch_iso_utc(long long epoch_seconds) {
    return format_epoch_with_pattern_utc(epoch_seconds, ISO_8601_WITH_Z);
}

std::string format_epoch_with_pattern_utc(long long epoch_seconds, const char* pattern) {
    std::time_t in_time_t = static_cast<std::time_t>(epoch_seconds);
    std::stringstream ss;

    // Use thread-safe gmtime_r instead of gmtime
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, pattern);
    return ss.str();
}

long long days_from_civil(int year, int month, int day) {
    long long adjusted_year = static_cast<long long>(year) - (month <= 2 ? 1 : 0);
    long long era = (adjusted_year >= 0 ? adjusted_year : adjusted_year - 399) / 400;
    long long year_of_era = adjusted_year - era * 400;
    long long day_of_year = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    long long day_of_era = year_of_era * 365 + year_of_era / 4 - year_of_era / 100 + day_of_year;
    return era * 146097 + day_of_era - 719468;
}

CivilDate civil_from_days(long long days_since_epoch) {
    long long shifted_days = days_since_epoch + 719468;
    long long era = (shifted_days >= 0 ? shifted_days : shifted_days - 146096) / 146097;
    long long day_of_era = shifted_days - era * 146097;
    long long year_of_era = (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
    long long day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
    long long month_index = (5 * day_of_year + 2) / 153;

    CivilDate civil_date;
    civil_date.day = static_cast<int>(day_of_year - (153 * month_index + 2) / 5 + 1);
    civil_date.month = static_cast<int>(month_index < 10 ? month_index + 3 : month_index - 9);
    civil_date.year = static_cast<int>(year_of_era + era * 400 + (civil_date.month <= 2 ? 1 : 0));
    return civil_date;
}

int weekday_from_days(long long days_since_epoch) {
    // 1970-01-01 was a Thursday
    long long weekday = (days_since_epoch + 4) % 7;
    return static_cast<int>(weekday < 0 ? weekday + 7 : weekday);
}

long long make_utc_timestamp(int year, int month, int day, int hour, int minute, int second) {
    return days_from_civil(year, month, day) * SECONDS_PER_DAY + hour * SECONDS_PER_HOUR +
           minute * SECONDS_PER_MINUTE + second;
}

long long floor_to_multiple(long long value, long long unit_seconds) {
    long long remainder = value % unit_seconds;
    if (remainder < 0) {
        remainder += unit_seconds;
    }
    return value - remainder;
}

long long convert_milliseconds_to_epoch_seconds(long long milliseconds_timestamp) {
    return floor_to_multiple(milliseconds_timestamp, MILLISECONDS_PER_SECOND) / MILLISECONDS_PER_SECOND;
}

std::chrono::system_clock::time_point epoch_seconds_to_time_point(long long epoch_seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(epoch_seconds));
}

long long time_point_to_epoch_seconds(std::chrono::system_clock::time_point time_point_value) {
    return std::chrono::duration_cast<std::chrono::seconds>(time_point_value.time_since_epoch()).count();
}

} // namespace TimeUtils
