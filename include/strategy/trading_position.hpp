#pragma once

#include "../types.hpp"
#include "signal.hpp"

namespace fbt {
namespace strategy {

/**
 * Trading Position
 *
 * Single notional-sized futures position. The P&L of a position depends only
 * on the relative price move and the notional, not on a contract quantity.
 */
struct TradingPosition {
    Signal side = Signal::Flat;
    Price entry_price = 0;   // After slippage
    Timestamp entry_time = 0;
    Notional notional = 0;   // Currency exposure put at risk
    Notional requested_notional = 0; // What the sizer asked for

    bool is_flat() const { return side == Signal::Flat; }

    // Gross P&L (no fees) if the position were closed at exit_price
    PnL gross_pnl(Price exit_price) const {
        if (is_flat() || entry_price == 0)
            return 0;
        return signal_direction(side) * (exit_price - entry_price) / entry_price * notional;
    }
};

} // namespace strategy
} // namespace fbt
