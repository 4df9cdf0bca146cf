#include "optsim/backtest/trading_calendar.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {
namespace backtest {

bool TradingCalendar::is_trading_day(const Timestamp& date) {
    return core::weekday_index(date) < 5;
}

std::vector<Timestamp> TradingCalendar::trading_days(const Timestamp& start,
                                                     const Timestamp& end) {
    std::vector<Timestamp> days;
    Timestamp first = core::floor_to_day(start);
    Timestamp last = core::floor_to_day(end);
    if (first > last) {
        return days;
    }

    days.reserve(static_cast<size_t>(core::days_between(first, last)) + 1);
    for (Timestamp day = first; day <= last; day = core::add_days(day, 1)) {
        if (is_trading_day(day)) {
            days.push_back(day);
        }
    }
    return days;
}

}  // namespace backtest
}  // namespace optsim
