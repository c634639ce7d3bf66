#pragma once

#include "../config/defaults.hpp"
#include "../strategy/signal.hpp"

#include <algorithm>
#include <cmath>
#include <functional>

namespace fbt {
namespace risk {

/**
 * Position Sizer
 *
 * Notional sizing rules, all pure functions of their inputs returning a USD
 * notional. Degenerate inputs (zero loss, zero volatility, zero stop
 * distance) return 0 instead of dividing by zero.
 */
class PositionSizer {
public:
    /**
     * Kelly criterion: f = (b*p - q) / b with b = avg_win / avg_loss.
     * Fraction clamped to [0, max_fraction].
     *
     * @param win_rate Historical win rate (0-1)
     */
    static double kelly_criterion(double win_rate, double avg_win, double avg_loss, double account_size,
                                  double max_fraction = config::sizing::KELLY_MAX_FRACTION) {
        if (avg_loss == 0) return 0;

        double b = avg_win / avg_loss;
        if (b == 0) return 0;
        double p = win_rate;
        double q = 1 - win_rate;

        double fraction = (b * p - q) / b;
        fraction = std::clamp(fraction, 0.0, std::max(max_fraction, 0.0));
        return account_size * fraction;
    }

    static double fixed_fraction(double account_size, double risk_fraction = config::sizing::FIXED_FRACTION) {
        return account_size * risk_fraction;
    }

    /**
     * Scale the base fraction inversely with volatility (annualized),
     * bounded to [0.5%, 10%] of the account.
     */
    static double volatility_adjusted(double account_size, double current_volatility,
                                      double target_volatility = config::sizing::TARGET_VOLATILITY,
                                      double base_fraction = config::sizing::FIXED_FRACTION) {
        if (current_volatility == 0) return 0;

        double fraction = base_fraction * (target_volatility / current_volatility);
        fraction = std::min(fraction, config::sizing::VOL_MAX_FRACTION);
        fraction = std::max(fraction, config::sizing::VOL_MIN_FRACTION);
        return account_size * fraction;
    }

    /**
     * Size so that hitting the stop loses risk_amount_usd.
     * Capped at 10% of the account.
     */
    static double risk_based(double account_size, double entry_price, double stop_loss_price,
                             double risk_amount_usd) {
        if (entry_price == stop_loss_price) return 0;

        double price_risk = std::abs(entry_price - stop_loss_price);
        double size = risk_amount_usd / price_risk * entry_price;
        return std::min(size, account_size * config::sizing::RISK_BASED_MAX_FRACTION);
    }

    // Shrink the fraction as leverage grows (leverage capped at max_leverage)
    static double leverage_adjusted(double account_size, double leverage,
                                    double base_fraction = config::sizing::FIXED_FRACTION,
                                    double max_leverage = config::sizing::MAX_LEVERAGE) {
        leverage = std::min(leverage, max_leverage);
        if (leverage <= 0) return 0;
        return account_size * (base_fraction / leverage);
    }

    static double leverage_for_position(double account_size, double position_size_usd) {
        if (account_size == 0) return 0;
        return position_size_usd / account_size;
    }
};

/**
 * Sizer callback: fixed fraction of equity, nothing while flat.
 */
inline std::function<double(double, strategy::Signal)> fixed_fraction_sizer(
    double fraction = config::sizing::FIXED_FRACTION) {
    return [fraction](double equity, strategy::Signal signal) {
        if (signal == strategy::Signal::Flat) return 0.0;
        return PositionSizer::fixed_fraction(equity, fraction);
    };
}

} // namespace risk
} // namespace fbt
