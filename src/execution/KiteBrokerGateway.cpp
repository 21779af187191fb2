#include "execution/KiteBrokerGateway.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <cmath>
#include <cstdio>

namespace daypilot {
namespace execution {

namespace {
std::string formatTrigger(double price) {
    // exchange tick for the stop trigger is 0.1
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f", std::round(price * 10.0) / 10.0);
    return buffer;
}
}

KiteBrokerGateway::KiteBrokerGateway(std::shared_ptr<network::IHttpClient> client, KiteSettings settings)
    : client_(std::move(client))
    , settings_(std::move(settings))
{
    network::authorizeKiteClient(*client_, settings_.credentials);
}

double KiteBrokerGateway::getAvailableMargin() {
    const auto data = network::parseKiteEnvelope(client_->get("/user/margins"), "margin query");
    try {
        return data.at("equity").at("available").at("cash").get<double>();
    } catch (const nlohmann::json::exception& e) {
        throw ExternalCallError(std::string("margin response missing equity.available.cash: ") + e.what());
    }
}

std::map<std::string, std::string> KiteBrokerGateway::baseOrderForm(const std::string& symbol, Direction side,
                                                                    int quantity) const {
    if (side == Direction::NONE || quantity <= 0) {
        throw ExternalCallError("refusing malformed order");
    }
    std::map<std::string, std::string> form;
    form["tradingsymbol"] = symbol;
    form["exchange"] = settings_.exchange;
    form["transaction_type"] = toString(side);
    form["quantity"] = std::to_string(quantity);
    form["product"] = settings_.product;
    form["validity"] = "DAY";
    return form;
}

std::string KiteBrokerGateway::placeOrder(const std::map<std::string, std::string>& form,
                                          const std::string& what) {
    const auto data = network::parseKiteEnvelope(client_->postForm("/orders/regular", form), what);
    const std::string order_id = data.value("order_id", std::string());
    if (order_id.empty()) {
        throw ExternalCallError(what + " accepted without an order id");
    }
    LOG_INFO("{} placed: {} {} x{} (id {})", what, form.at("transaction_type"), form.at("tradingsymbol"),
             form.at("quantity"), order_id);
    return order_id;
}

std::string KiteBrokerGateway::placeMarketOrder(const MarketOrderRequest& request) {
    auto form = baseOrderForm(request.symbol, request.side, request.quantity);
    form["order_type"] = "MARKET";
    return placeOrder(form, "Market order");
}

std::string KiteBrokerGateway::submitStopOrder(const StopOrderRequest& request) {
    if (request.trade_direction == Direction::NONE) {
        throw ExternalCallError("refusing stop order without a trade direction");
    }
    auto form = baseOrderForm(request.symbol, exitSide(request.trade_direction), request.quantity);
    form["order_type"] = "SL-M";
    form["trigger_price"] = formatTrigger(request.trigger_price);
    return placeOrder(form, "Stop order");
}

void KiteBrokerGateway::modifyStopOrder(const std::string& order_id, double trigger_price) {
    std::map<std::string, std::string> form;
    form["order_type"] = "SL-M";
    form["trigger_price"] = formatTrigger(trigger_price);
    network::parseKiteEnvelope(client_->putForm("/orders/regular/" + order_id, form), "stop modification");
    LOG_INFO("Stop order {} moved to {}", order_id, form["trigger_price"]);
}

void KiteBrokerGateway::cancelOrder(const std::string& order_id) {
    network::parseKiteEnvelope(client_->del("/orders/regular/" + order_id), "order cancellation");
    LOG_INFO("Order {} cancelled", order_id);
}

} // namespace execution
} // namespace daypilot
