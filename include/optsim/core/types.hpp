// include/optsim/core/types.hpp

#pragma once

#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace optsim {

/**
 * @brief Timestamp type for consistent time representation
 * Trading dates are UTC midnights
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Contract multiplier for equity options
 */
constexpr double CONTRACT_MULTIPLIER = 100.0;

/**
 * @brief Option right
 */
enum class OptionType {
    CALL,
    PUT
};

inline std::string option_type_to_string(OptionType type) {
    return type == OptionType::CALL ? "call" : "put";
}

/**
 * @brief Parse "call"/"put" (also accepts "C"/"P" and upper case)
 * @return std::nullopt for anything else
 */
inline std::optional<OptionType> option_type_from_string(const std::string& text) {
    if (text == "call" || text == "CALL" || text == "C" || text == "c")
        return OptionType::CALL;
    if (text == "put" || text == "PUT" || text == "P" || text == "p")
        return OptionType::PUT;
    return std::nullopt;
}

struct Greeks {
    double implied_volatility{0.0};
    double delta{0.0};
    double gamma{0.0};
    double theta{0.0};
    double vega{0.0};
};

/**
 * @brief One row of an option chain on a given day
 */
struct OptionQuote {
    std::string symbol;
    OptionType option_type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;
    Price bid{0.0};
    Price ask{0.0};
    Price last{0.0};
    int64_t volume{0};
    int64_t open_interest{0};
    Price underlying_price{0.0};
    std::optional<Greeks> greeks;

    /**
     * @brief Reference price: last trade, else bid/ask mid, else 0
     */
    Price mark_price() const {
        if (last > 0.0) {
            return last;
        }
        if (bid > 0.0 && ask > 0.0) {
            return (bid + ask) / 2.0;
        }
        return 0.0;
    }

    double notional_value() const {
        return mark_price() * static_cast<double>(volume) * CONTRACT_MULTIPLIER;
    }
};

constexpr double STRIKE_TOLERANCE = 1e-6;

/**
 * @brief All option chains and underlying prices known on one trading day
 */
struct MarketSnapshot {
    Timestamp date;
    std::unordered_map<std::string, std::vector<OptionQuote>> chains;
    std::unordered_map<std::string, Price> underlying_prices;

    /**
     * @brief Locate a contract by its identifying fields
     * @return Pointer into the chain, or nullptr if the contract is not quoted
     */
    const OptionQuote* find_quote(const std::string& symbol, OptionType type, double strike,
                                  const Timestamp& expiration) const {
        auto it = chains.find(symbol);
        if (it == chains.end()) {
            return nullptr;
        }
        for (const auto& quote : it->second) {
            if (quote.option_type == type && quote.expiration == expiration &&
                std::abs(quote.strike - strike) < STRIKE_TOLERANCE) {
                return &quote;
            }
        }
        return nullptr;
    }

    bool has_symbol(const std::string& symbol) const {
        return chains.find(symbol) != chains.end();
    }
};

/**
 * @brief Strategy request to buy a contract at a reference price
 */
struct Signal {
    std::string symbol;
    OptionType option_type{OptionType::CALL};
    double strike{0.0};
    Timestamp expiration;
    Price price{0.0};
};

}  // namespace optsim
