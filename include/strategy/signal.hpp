#pragma once

namespace fbt {
namespace strategy {

/**
 * Trading Signal
 *
 * Desired position for the current bar. The integer value is the position
 * side used in P&L math (+1 long, -1 short, 0 flat).
 */
enum class Signal : int {
    Flat = 0,  // No position
    Long = 1,  // Hold long
    Short = -1 // Hold short
};

inline int signal_direction(Signal sig) {
    return static_cast<int>(sig);
}

inline const char* signal_to_string(Signal sig) {
    switch (sig) {
    case Signal::Long:
        return "LONG";
    case Signal::Short:
        return "SHORT";
    default:
        return "FLAT";
    }
}

} // namespace strategy
} // namespace fbt
