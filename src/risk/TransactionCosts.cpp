#include "risk/TransactionCosts.h"
#include "common/Logger.h"
#include <algorithm>

namespace daypilot {
namespace risk {

ChargeBreakdown calculateCharges(double entry, double exit, int quantity, Direction direction,
                                 const CostSchedule& schedule) {
    ChargeBreakdown c;
    const double qty = static_cast<double>(quantity);

    c.gross_pnl = direction == Direction::SELL ? (entry - exit) * qty : (exit - entry) * qty;
    c.turnover = (entry + exit) * qty;
    c.brokerage = std::min(schedule.brokerage_cap_per_leg, schedule.brokerage_rate * c.turnover) * 2.0;
    c.stt = direction == Direction::SELL ? schedule.stt_rate * exit * qty : 0.0;
    c.gst = schedule.gst_rate * c.brokerage;
    c.sebi = schedule.sebi_rate * c.turnover;
    c.stamp = direction == Direction::BUY ? schedule.stamp_rate * entry * qty : 0.0;
    c.net_pnl = roundTo2(c.gross_pnl - c.totalCharges());

    LOG_DEBUG("Charges: gross {:.2f} brokerage {:.2f} stt {:.2f} gst {:.2f} sebi {:.2f} stamp {:.2f} net {:.2f}",
              c.gross_pnl, c.brokerage, c.stt, c.gst, c.sebi, c.stamp, c.net_pnl);
    return c;
}

} // namespace risk
} // namespace daypilot
