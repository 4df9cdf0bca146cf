// include/optsim/backtest/trading_calendar.hpp
#pragma once

#include <vector>
#include "optsim/core/types.hpp"

namespace optsim {
namespace backtest {

/**
 * @brief Weekday-only trading calendar
 *
 * No exchange holidays are modelled; every Monday to Friday is a trading day.
 */
class TradingCalendar {
public:
    /**
     * @brief True for Monday to Friday
     */
    static bool is_trading_day(const Timestamp& date);

    /**
     * @brief All trading days in [start, end], ascending, at UTC midnight
     * @return Empty if start is after end
     */
    static std::vector<Timestamp> trading_days(const Timestamp& start, const Timestamp& end);
};

}  // namespace backtest
}  // namespace optsim
