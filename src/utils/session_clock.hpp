#ifndef SESSION_CLOCK_HPP
#define SESSION_CLOCK_HPP

#include "configs/session_config.hpp"

namespace SellManager {
namespace Core {

/**
 * Exchange-local time arithmetic over epoch seconds.
 * A fixed standard offset plus, optionally, the US daylight saving rule.
 */
class ExchangeSessionClock {
public:
    explicit ExchangeSessionClock(const Config::SessionConfig& session_config);

    long long utc_offset_seconds(long long utc_epoch_seconds) const;
    bool is_daylight_saving(long long utc_epoch_seconds) const;

    long long to_local_seconds(long long utc_epoch_seconds) const;
    long long local_seconds_to_utc(long long local_epoch_seconds) const;

    // UTC instant of 00:00 local on the local date containing utc_epoch_seconds
    long long local_midnight_utc(long long utc_epoch_seconds) const;
    int local_weekday(long long utc_epoch_seconds) const;   // 0 = Sunday
    bool is_weekday(long long utc_epoch_seconds) const;

    long long market_open_utc_on_local_date(long long utc_epoch_seconds) const;

    const Config::SessionConfig& get_config() const { return config; }

private:
    Config::SessionConfig config;
    long long standard_offset_seconds;

    long long dst_start_utc(int year) const;
    long long dst_end_utc(int year) const;
};

} // namespace Core
} // namespace SellManager

#endif // SESSION_CLOCK_HPP
