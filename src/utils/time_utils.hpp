#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>

namespace TimeUtils {

// Time conversion constants
constexpr long long MILLISECONDS_PER_SECOND = 1000;
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;

// Time format constants
constexpr const char* ISO_8601_WITH_Z = "%Y-%m-%dT%H:%M:%SZ";
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* RUN_FOLDER_STAMP = "%Y%m%d-%H%M%S";
constexpr const char* GATEWAY_START_TIME = "%Y%m%d-%H:%M:%S";

struct CivilDate {
    int year;
    int month;
    int day;
};

// Current time formatting
std::string get_current_human_readable_time();
long long current_epoch_seconds();

// Epoch second formatting (UTC)
std::string format_epoch_iso_utc(long long epoch_seconds);
std::string format_epoch_with_pattern_utc(long long epoch_seconds, const char* pattern);

// Proleptic Gregorian calendar arithmetic, independent of the process timezone
long long days_from_civil(int year, int month, int day);
CivilDate civil_from_days(long long days_since_epoch);
int weekday_from_days(long long days_since_epoch);   // 0 = Sunday
long long make_utc_timestamp(int year, int month, int day, int hour = 0, int minute = 0, int second = 0);

// Floor towards negative infinity to a multiple of unit_seconds
long long floor_to_multiple(long long value, long long unit_seconds);

// Timestamp conversion functions
long long convert_milliseconds_to_epoch_seconds(long long milliseconds_timestamp);
std::chrono::system_clock::time_point epoch_seconds_to_time_point(long long epoch_seconds);
long long time_point_to_epoch_seconds(std::chrono::system_clock::time_point time_point_value);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
