#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace fbt {

// Milliseconds since Unix epoch (UTC), as delivered by exchange kline exports
using Timestamp = uint64_t;

// Prices and currency amounts are plain doubles: futures notionals are
// leverage-scaled and do not fit the fixed-point range of an order book price
using Price = double;
using Notional = double;
using PnL = double;

constexpr Timestamp MS_PER_SECOND = 1000;
constexpr Timestamp MS_PER_MINUTE = 60 * MS_PER_SECOND;
constexpr Timestamp MS_PER_HOUR = 60 * MS_PER_MINUTE;
constexpr Timestamp MS_PER_DAY = 24 * MS_PER_HOUR;

/**
 * Contract violation by a caller: bad bar series, bad engine parameters.
 * Raised at the entry point before any state is touched.
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

} // namespace fbt
