// include/optsim/data/postgres_market_data_provider.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "optsim/data/market_data_provider.hpp"
#include "optsim/data/postgres_database.hpp"

namespace optsim {

struct PostgresMarketDataConfig {
    std::string option_chain_table = "market_data.option_chains";
    std::string underlying_table = "market_data.underlying_daily";
};

/**
 * @brief MarketDataProvider backed by PostgresDatabase
 */
class PostgresMarketDataProvider : public MarketDataProvider {
public:
    PostgresMarketDataProvider(std::shared_ptr<PostgresDatabase> db,
                               PostgresMarketDataConfig config = {});

    Result<std::vector<OptionQuote>> get_option_chain(const std::string& symbol,
                                                      const Timestamp& date) override;

    Result<std::vector<std::pair<Timestamp, double>>> get_underlying_history(
        const std::string& symbol, const Timestamp& start, const Timestamp& end) override;

    /**
     * @brief Convert an option chain table to quotes
     *
     * Rows with an unknown option_type are skipped with a warning. Greeks are
     * attached only when implied_volatility is non-null.
     */
    static Result<std::vector<OptionQuote>> table_to_quotes(
        const std::shared_ptr<arrow::Table>& table);

    static Result<std::vector<std::pair<Timestamp, double>>> table_to_history(
        const std::shared_ptr<arrow::Table>& table);

private:
    std::shared_ptr<PostgresDatabase> db_;
    PostgresMarketDataConfig config_;
};

}  // namespace optsim
