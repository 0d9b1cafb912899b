#ifndef BROKER_INTERFACES_HPP
#define BROKER_INTERFACES_HPP

#include "trader/data_structures/data_structures.hpp"
#include <memory>
#include <string>
#include <vector>

namespace SellManager {
namespace API {

/**
 * Historical bar provider.
 * Returning fewer bars than requested, or none, is a valid answer meaning no older data exists.
 * Failures are raised as TransientNetworkError, PacingViolationError or BrokerConnectionError.
 */
class HistoricalDataSource {
public:
    virtual ~HistoricalDataSource() = default;

    virtual std::vector<Core::Bar> get_historical_bars(const Core::HistoricalBarsRequest& request) = 0;
};

class PositionSource {
public:
    virtual ~PositionSource() = default;

    virtual std::vector<Core::Position> get_positions() = 0;
    virtual std::vector<Core::Order> get_open_orders() = 0;
};

// Only wired in when order transmission is explicitly enabled.
class OrderSink {
public:
    virtual ~OrderSink() = default;

    virtual Core::OrderResult place_order(const std::string& instrument_key, Core::OrderSide side, double quantity) = 0;
    virtual bool cancel_order(const std::string& order_id) = 0;
};

using HistoricalDataSourcePtr = std::shared_ptr<HistoricalDataSource>;
using PositionSourcePtr = std::shared_ptr<PositionSource>;
using OrderSinkPtr = std::shared_ptr<OrderSink>;

} // namespace API
} // namespace SellManager

#endif // BROKER_INTERFACES_HPP
