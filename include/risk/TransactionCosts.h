#pragma once

#include "common/Types.h"

namespace daypilot {
namespace risk {

// Index-derivative intraday charges
struct CostSchedule {
    double brokerage_rate = 0.0003;
    double brokerage_cap_per_leg = 20.0;
    double stt_rate = 0.00025;          // on exit value, SELL trades only
    double gst_rate = 0.18;             // on brokerage
    double sebi_rate = 0.000001;        // on turnover
    double stamp_rate = 0.00003;        // on entry value, BUY trades only
};

struct ChargeBreakdown {
    double gross_pnl = 0.0;
    double turnover = 0.0;
    double brokerage = 0.0;
    double stt = 0.0;
    double gst = 0.0;
    double sebi = 0.0;
    double stamp = 0.0;
    double net_pnl = 0.0;               // rounded to 2 decimals

    double totalCharges() const { return brokerage + stt + gst + sebi + stamp; }
};

ChargeBreakdown calculateCharges(double entry, double exit, int quantity, Direction direction,
                                 const CostSchedule& schedule = CostSchedule());

inline double calculateNetPnl(double entry, double exit, int quantity, Direction direction) {
    return calculateCharges(entry, exit, quantity, direction).net_pnl;
}

} // namespace risk
} // namespace daypilot
