#ifndef SESSION_CONFIG_HPP
#define SESSION_CONFIG_HPP

namespace SellManager {
namespace Config {

// Reference exchange timezone and session anchors.
struct SessionConfig {
    int utc_offset_hours = -5;                       // Standard-time offset of the exchange
    bool observe_us_dst = true;                      // Second Sunday of March to first Sunday of November
    int market_open_hour = 9;
    int market_open_minute = 30;
    int end_of_day_fire_hour = 15;
    int end_of_day_fire_minute = 59;
    int end_of_day_fire_second = 55;
    bool end_of_day_weekdays_only = true;
    int hour_bucket_anchor_minutes = 30;             // 09:30 + 10:00 form the 10:00 hourly bar
};

} // namespace Config
} // namespace SellManager

#endif // SESSION_CONFIG_HPP
