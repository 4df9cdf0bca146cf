#include "optsim/backtest/fill_model.hpp"
#include <cmath>
#include <limits>

namespace optsim {
namespace backtest {

FillModel::FillModel(const FillModelConfig& config) : config_(config) {}

Price FillModel::apply_slippage(Price price, OptionType type, FillSide side) const {
    bool pay_up = (type == OptionType::CALL) == (side == FillSide::OPEN);
    return pay_up ? price * (1.0 + config_.slippage_pct) : price * (1.0 - config_.slippage_pct);
}

double FillModel::calculate_commission(int contracts) const {
    return config_.commission_per_contract * contracts;
}

double FillModel::entry_cost(Price fill, int contracts) const {
    return fill * CONTRACT_MULTIPLIER * contracts + calculate_commission(contracts);
}

double FillModel::exit_proceeds(Price fill, int contracts) const {
    return fill * CONTRACT_MULTIPLIER * contracts - calculate_commission(contracts);
}

int FillModel::max_affordable_contracts(Price fill, double capital) const {
    double per_contract = fill * CONTRACT_MULTIPLIER + config_.commission_per_contract;
    if (per_contract <= 0.0 || capital <= 0.0) {
        return 0;
    }
    double count = std::floor(capital / per_contract);
    if (count > static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    int contracts = static_cast<int>(count);
    // Floating point rounding can land one contract off in either direction
    while (contracts > 0 && entry_cost(fill, contracts) > capital) {
        --contracts;
    }
    while (contracts < std::numeric_limits<int>::max() &&
           entry_cost(fill, contracts + 1) <= capital) {
        ++contracts;
    }
    return contracts;
}

}  // namespace backtest
}  // namespace optsim
