#include "execution/PaperBroker.h"
#include "common/Errors.h"
#include "common/Logger.h"

namespace daypilot {
namespace execution {

PaperBroker::PaperBroker(double margin)
    : margin_(margin)
{}

double PaperBroker::getAvailableMargin() {
    return margin_;
}

std::string PaperBroker::nextOrderId() {
    return "PAPER-" + std::to_string(++order_seq_);
}

std::string PaperBroker::placeMarketOrder(const MarketOrderRequest& request) {
    market_orders_.push_back(request);
    const std::string order_id = nextOrderId();
    LOG_INFO("[PAPER] {} MARKET {} x{} ({})", toString(request.side), request.symbol,
             request.quantity, order_id);
    return order_id;
}

std::string PaperBroker::submitStopOrder(const StopOrderRequest& request) {
    stop_orders_.push_back(request);
    const std::string order_id = nextOrderId();
    working_stops_[order_id] = request;
    LOG_INFO("[PAPER] {} SL-M {} x{} trigger {:.1f} protecting {} ({})",
             toString(exitSide(request.trade_direction)), request.symbol, request.quantity,
             request.trigger_price, toString(request.trade_direction), order_id);
    return order_id;
}

void PaperBroker::modifyStopOrder(const std::string& order_id, double trigger_price) {
    auto it = working_stops_.find(order_id);
    if (it == working_stops_.end()) {
        throw ExternalCallError("unknown paper order " + order_id);
    }
    it->second.trigger_price = trigger_price;
    LOG_INFO("[PAPER] stop {} moved to {:.1f}", order_id, trigger_price);
}

void PaperBroker::cancelOrder(const std::string& order_id) {
    if (working_stops_.erase(order_id) == 0) {
        throw ExternalCallError("unknown paper order " + order_id);
    }
    LOG_INFO("[PAPER] order {} cancelled", order_id);
}

} // namespace execution
} // namespace daypilot
