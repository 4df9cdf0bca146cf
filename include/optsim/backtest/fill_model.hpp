// include/optsim/backtest/fill_model.hpp
#pragma once

#include "optsim/core/types.hpp"

namespace optsim {
namespace backtest {

/**
 * @brief Order direction from the ledger's point of view
 */
enum class FillSide {
    OPEN,   // Buy to open
    CLOSE   // Sell to close
};

struct FillModelConfig {
    double commission_per_contract = 0.65;
    double slippage_pct = 0.01;
};

/**
 * @brief Simulated fills for option orders
 *
 * Slippage always moves the price against the trader: a call is bought
 * above and sold below the reference price, a put the other way round.
 */
class FillModel {
public:
    explicit FillModel(const FillModelConfig& config);

    /**
     * @brief Apply slippage to a reference price
     * @param price Quoted reference price
     * @param type Option right of the contract
     * @param side Opening or closing the position
     * @return Fill price per share
     */
    Price apply_slippage(Price price, OptionType type, FillSide side) const;

    /**
     * @brief Commission for a number of contracts
     */
    double calculate_commission(int contracts) const;

    /**
     * @brief Cash paid to open: fill x 100 x contracts + commission
     */
    double entry_cost(Price fill, int contracts) const;

    /**
     * @brief Cash received on close: fill x 100 x contracts - commission
     */
    double exit_proceeds(Price fill, int contracts) const;

    /**
     * @brief Largest contract count whose entry cost fits in capital
     */
    int max_affordable_contracts(Price fill, double capital) const;

    const FillModelConfig& config() const {
        return config_;
    }

private:
    FillModelConfig config_;
};

}  // namespace backtest
}  // namespace optsim
