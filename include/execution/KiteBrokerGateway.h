#pragma once

#include "execution/IBrokerGateway.h"
#include "network/IHttpClient.h"
#include "network/KiteSession.h"
#include <memory>

namespace daypilot {
namespace execution {

struct KiteSettings {
    network::KiteCredentials credentials;
    std::string exchange = "NFO";
    std::string product = "MIS";
};

// Kite Connect REST gateway. The access token must already be provisioned in
// the token file; there is no interactive login.
class KiteBrokerGateway : public IBrokerGateway {
public:
    KiteBrokerGateway(std::shared_ptr<network::IHttpClient> client, KiteSettings settings);

    double getAvailableMargin() override;
    std::string placeMarketOrder(const MarketOrderRequest& request) override;
    std::string submitStopOrder(const StopOrderRequest& request) override;
    void modifyStopOrder(const std::string& order_id, double trigger_price) override;
    void cancelOrder(const std::string& order_id) override;

private:
    std::map<std::string, std::string> baseOrderForm(const std::string& symbol, Direction side,
                                                     int quantity) const;
    std::string placeOrder(const std::map<std::string, std::string>& form, const std::string& what);

    std::shared_ptr<network::IHttpClient> client_;
    KiteSettings settings_;
};

} // namespace execution
} // namespace daypilot
