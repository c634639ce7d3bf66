#pragma once

#include "../types.hpp"
#include "defaults.hpp"

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace fbt {
namespace config {

using json = nlohmann::json;

/**
 * Backtest Configuration
 *
 * Everything needed to reproduce a run. Loaded from JSON:
 * {
 *   "initial_capital": 100000,
 *   "maker_fee": 0.0002,
 *   "taker_fee": 0.0004,
 *   "slippage_pct": 0.01,
 *   "leverage": 3.0,
 *   "risk_free_rate": 0.02
 * }
 * Missing keys keep their defaults.
 */
struct BacktestConfig {
    double initial_capital = account::INITIAL_CAPITAL;
    double maker_fee = costs::MAKER_FEE_RATE;   // Not charged by the engine
    double taker_fee = costs::TAKER_FEE_RATE;   // Charged on entry and exit
    double slippage_pct = costs::SLIPPAGE_PCT;  // Percent, 0.01 = 0.01%
    double leverage = account::LEVERAGE;
    double risk_free_rate = metrics::RISK_FREE_RATE; // Annual, for Sharpe/Sortino

    // Throws InvalidInputError on the first bad field
    void validate() const {
        if (!std::isfinite(initial_capital) || initial_capital <= 0) {
            throw InvalidInputError("initial_capital must be > 0, got " + std::to_string(initial_capital));
        }
        if (!std::isfinite(leverage) || leverage < account::MIN_LEVERAGE) {
            throw InvalidInputError("leverage must be >= 1, got " + std::to_string(leverage));
        }
        if (!std::isfinite(maker_fee) || maker_fee < 0) {
            throw InvalidInputError("maker_fee must be >= 0, got " + std::to_string(maker_fee));
        }
        if (!std::isfinite(taker_fee) || taker_fee < 0) {
            throw InvalidInputError("taker_fee must be >= 0, got " + std::to_string(taker_fee));
        }
        if (!std::isfinite(slippage_pct) || slippage_pct < 0) {
            throw InvalidInputError("slippage_pct must be >= 0, got " + std::to_string(slippage_pct));
        }
        if (!std::isfinite(risk_free_rate)) {
            throw InvalidInputError("risk_free_rate must be finite");
        }
    }

    json to_json() const {
        return json{
            {"initial_capital", initial_capital},
            {"maker_fee", maker_fee},
            {"taker_fee", taker_fee},
            {"slippage_pct", slippage_pct},
            {"leverage", leverage},
            {"risk_free_rate", risk_free_rate},
        };
    }

    // Wrong value types surface as nlohmann::json::type_error
    static BacktestConfig from_json(const json& j) {
        if (!j.is_object()) {
            throw std::runtime_error("Backtest config must be a JSON object");
        }

        BacktestConfig config;
        config.initial_capital = j.value("initial_capital", config.initial_capital);
        config.maker_fee = j.value("maker_fee", config.maker_fee);
        config.taker_fee = j.value("taker_fee", config.taker_fee);
        config.slippage_pct = j.value("slippage_pct", config.slippage_pct);
        config.leverage = j.value("leverage", config.leverage);
        config.risk_free_rate = j.value("risk_free_rate", config.risk_free_rate);
        return config;
    }
};

/**
 * Load and validate a backtest config file
 */
inline BacktestConfig load_backtest_config(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + filename + ": " + e.what());
    }

    BacktestConfig config = BacktestConfig::from_json(j);
    config.validate();
    return config;
}

/**
 * Write config as pretty-printed JSON
 */
inline void save_backtest_config(const std::string& filename, const BacktestConfig& config) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot create config file: " + filename);
    }
    file << config.to_json().dump(2) << "\n";
}

} // namespace config
} // namespace fbt
