#pragma once

#include "common/Types.h"
#include <string>

namespace daypilot {
namespace execution {

// Market order on an explicit side: the entry itself, or a square-off.
struct MarketOrderRequest {
    std::string symbol;
    Direction side = Direction::NONE;
    int quantity = 0;
};

// Protective stop for an open position. trade_direction is the direction of
// the position being protected; the gateway places the opposite side.
struct StopOrderRequest {
    std::string symbol;
    Direction trade_direction = Direction::NONE;
    int quantity = 0;
    double trigger_price = 0.0;
};

// Every call throws ExternalCallError when the broker cannot be reached or
// rejects the request.
class IBrokerGateway {
public:
    virtual ~IBrokerGateway() = default;

    virtual double getAvailableMargin() = 0;

    // Returns the broker order id
    virtual std::string placeMarketOrder(const MarketOrderRequest& request) = 0;
    virtual std::string submitStopOrder(const StopOrderRequest& request) = 0;

    virtual void modifyStopOrder(const std::string& order_id, double trigger_price) = 0;
    virtual void cancelOrder(const std::string& order_id) = 0;
};

inline Direction exitSide(Direction trade_direction) {
    return trade_direction == Direction::BUY ? Direction::SELL : Direction::BUY;
}

} // namespace execution
} // namespace daypilot
