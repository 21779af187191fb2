#pragma once

#include "execution/IBrokerGateway.h"
#include <map>
#include <vector>

namespace daypilot {
namespace execution {

// Bookkeeping-only broker: fixed margin, orders are logged and remembered.
class PaperBroker : public IBrokerGateway {
public:
    explicit PaperBroker(double margin);

    double getAvailableMargin() override;
    std::string placeMarketOrder(const MarketOrderRequest& request) override;
    std::string submitStopOrder(const StopOrderRequest& request) override;
    void modifyStopOrder(const std::string& order_id, double trigger_price) override;
    void cancelOrder(const std::string& order_id) override;

    const std::vector<MarketOrderRequest>& marketOrders() const { return market_orders_; }
    const std::vector<StopOrderRequest>& submittedOrders() const { return stop_orders_; }

    // Stops not yet cancelled, by order id
    const std::map<std::string, StopOrderRequest>& workingStops() const { return working_stops_; }

private:
    std::string nextOrderId();

    double margin_;
    int order_seq_ = 0;
    std::vector<MarketOrderRequest> market_orders_;
    std::vector<StopOrderRequest> stop_orders_;
    std::map<std::string, StopOrderRequest> working_stops_;
};

} // namespace execution
} // namespace daypilot
