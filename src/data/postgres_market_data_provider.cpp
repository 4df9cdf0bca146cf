// src/data/postgres_market_data_provider.cpp

#include "optsim/data/postgres_market_data_provider.hpp"
#include "optsim/core/logger.hpp"

namespace optsim {

namespace {

template <typename ArrayType>
std::shared_ptr<ArrayType> column_as(const std::shared_ptr<arrow::Table>& table,
                                     const std::string& name) {
    auto column = table->GetColumnByName(name);
    if (!column || column->num_chunks() == 0) {
        return nullptr;
    }
    return std::static_pointer_cast<ArrayType>(column->chunk(0));
}

Timestamp from_epoch_seconds(int64_t seconds) {
    return Timestamp(std::chrono::seconds(seconds));
}

double value_or_zero(const std::shared_ptr<arrow::DoubleArray>& array, int64_t row) {
    return array->IsNull(row) ? 0.0 : array->Value(row);
}

}  // namespace

PostgresMarketDataProvider::PostgresMarketDataProvider(std::shared_ptr<PostgresDatabase> db,
                                                       PostgresMarketDataConfig config)
    : db_(std::move(db)), config_(std::move(config)) {
    if (!db_) {
        throw std::invalid_argument("PostgresMarketDataProvider requires a database");
    }
    Logger::register_component("PostgresMarketData");
}

Result<std::vector<OptionQuote>> PostgresMarketDataProvider::get_option_chain(
    const std::string& symbol, const Timestamp& date) {
    auto table = db_->get_option_chain(symbol, date, config_.option_chain_table);
    if (table.is_error()) {
        return make_error<std::vector<OptionQuote>>(table.error()->code(), table.error()->what(),
                                                    "PostgresMarketData");
    }
    return table_to_quotes(table.value());
}

Result<std::vector<std::pair<Timestamp, double>>>
PostgresMarketDataProvider::get_underlying_history(const std::string& symbol,
                                                   const Timestamp& start, const Timestamp& end) {
    auto table = db_->get_underlying_history(symbol, start, end, config_.underlying_table);
    if (table.is_error()) {
        return make_error<std::vector<std::pair<Timestamp, double>>>(
            table.error()->code(), table.error()->what(), "PostgresMarketData");
    }
    return table_to_history(table.value());
}

Result<std::vector<OptionQuote>> PostgresMarketDataProvider::table_to_quotes(
    const std::shared_ptr<arrow::Table>& table) {
    std::vector<OptionQuote> quotes;
    if (!table || table->num_rows() == 0) {
        return Result<std::vector<OptionQuote>>(std::move(quotes));
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::vector<OptionQuote>>(ErrorCode::CONVERSION_ERROR,
                                                    "Failed to combine option chain chunks: " +
                                                        combined.status().ToString(),
                                                    "PostgresMarketData");
    }
    auto data = *combined;

    auto symbols = column_as<arrow::StringArray>(data, "symbol");
    auto types = column_as<arrow::StringArray>(data, "option_type");
    auto strikes = column_as<arrow::DoubleArray>(data, "strike");
    auto expirations = column_as<arrow::TimestampArray>(data, "expiration");
    auto bids = column_as<arrow::DoubleArray>(data, "bid");
    auto asks = column_as<arrow::DoubleArray>(data, "ask");
    auto lasts = column_as<arrow::DoubleArray>(data, "last");
    auto volumes = column_as<arrow::Int64Array>(data, "volume");
    auto open_interests = column_as<arrow::Int64Array>(data, "open_interest");
    auto underlyings = column_as<arrow::DoubleArray>(data, "underlying_price");

    if (!symbols || !types || !strikes || !expirations || !bids || !asks || !lasts || !volumes ||
        !open_interests || !underlyings) {
        return make_error<std::vector<OptionQuote>>(
            ErrorCode::CONVERSION_ERROR, "Option chain table is missing required columns",
            "PostgresMarketData");
    }

    // Greeks are optional columns
    auto ivs = column_as<arrow::DoubleArray>(data, "implied_volatility");
    auto deltas = column_as<arrow::DoubleArray>(data, "delta");
    auto gammas = column_as<arrow::DoubleArray>(data, "gamma");
    auto thetas = column_as<arrow::DoubleArray>(data, "theta");
    auto vegas = column_as<arrow::DoubleArray>(data, "vega");

    quotes.reserve(static_cast<size_t>(data->num_rows()));
    for (int64_t i = 0; i < data->num_rows(); ++i) {
        auto type = option_type_from_string(types->GetString(i));
        if (!type) {
            WARN("Skipping quote with unknown option type '" << types->GetString(i) << "' for "
                                                              << symbols->GetString(i));
            continue;
        }

        OptionQuote quote;
        quote.symbol = symbols->GetString(i);
        quote.option_type = *type;
        quote.strike = strikes->Value(i);
        quote.expiration = from_epoch_seconds(expirations->Value(i));
        quote.bid = value_or_zero(bids, i);
        quote.ask = value_or_zero(asks, i);
        quote.last = value_or_zero(lasts, i);
        quote.volume = volumes->IsNull(i) ? 0 : volumes->Value(i);
        quote.open_interest = open_interests->IsNull(i) ? 0 : open_interests->Value(i);
        quote.underlying_price = value_or_zero(underlyings, i);

        if (ivs && !ivs->IsNull(i)) {
            Greeks greeks;
            greeks.implied_volatility = ivs->Value(i);
            greeks.delta = deltas ? value_or_zero(deltas, i) : 0.0;
            greeks.gamma = gammas ? value_or_zero(gammas, i) : 0.0;
            greeks.theta = thetas ? value_or_zero(thetas, i) : 0.0;
            greeks.vega = vegas ? value_or_zero(vegas, i) : 0.0;
            quote.greeks = greeks;
        }

        quotes.push_back(std::move(quote));
    }

    return Result<std::vector<OptionQuote>>(std::move(quotes));
}

Result<std::vector<std::pair<Timestamp, double>>> PostgresMarketDataProvider::table_to_history(
    const std::shared_ptr<arrow::Table>& table) {
    std::vector<std::pair<Timestamp, double>> history;
    if (!table || table->num_rows() == 0) {
        return Result<std::vector<std::pair<Timestamp, double>>>(std::move(history));
    }

    auto combined = table->CombineChunks();
    if (!combined.ok()) {
        return make_error<std::vector<std::pair<Timestamp, double>>>(
            ErrorCode::CONVERSION_ERROR,
            "Failed to combine history chunks: " + combined.status().ToString(),
            "PostgresMarketData");
    }

    auto times = column_as<arrow::TimestampArray>(*combined, "time");
    auto closes = column_as<arrow::DoubleArray>(*combined, "close");
    if (!times || !closes) {
        return make_error<std::vector<std::pair<Timestamp, double>>>(
            ErrorCode::CONVERSION_ERROR, "History table is missing time/close columns",
            "PostgresMarketData");
    }

    history.reserve(static_cast<size_t>(times->length()));
    for (int64_t i = 0; i < times->length(); ++i) {
        if (closes->IsNull(i)) {
            continue;
        }
        history.emplace_back(from_epoch_seconds(times->Value(i)), closes->Value(i));
    }

    return Result<std::vector<std::pair<Timestamp, double>>>(std::move(history));
}

}  // namespace optsim
