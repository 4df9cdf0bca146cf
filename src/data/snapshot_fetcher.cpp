// src/data/snapshot_fetcher.cpp

#include "optsim/data/snapshot_fetcher.hpp"
#include <future>
#include <system_error>
#include "optsim/core/logger.hpp"
#include "optsim/core/time_utils.hpp"

namespace optsim {

namespace {

using ChainResult = Result<std::vector<OptionQuote>>;

ChainResult load_chain(MarketDataProvider& provider, const std::string& symbol,
                       const Timestamp& date) {
    try {
        return provider.get_option_chain(symbol, date);
    } catch (const std::exception& e) {
        return make_error<std::vector<OptionQuote>>(
            ErrorCode::MARKET_DATA_ERROR,
            "Provider threw while loading " + symbol + ": " + e.what(), "SnapshotFetcher");
    }
}

}  // namespace

SnapshotFetcher::SnapshotFetcher(std::shared_ptr<MarketDataProvider> provider,
                                 const SnapshotFetcherConfig& config)
    : provider_(std::move(provider)), config_(config) {
    if (!provider_) {
        throw std::invalid_argument("SnapshotFetcher requires a market data provider");
    }
}

SnapshotFetcher::~SnapshotFetcher() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [symbol, request] : requests_) {
        if (request.valid()) {
            request.wait();
        }
    }
    requests_.clear();
}

void SnapshotFetcher::add_chain(SnapshotFetchResult& result, const std::string& symbol,
                                ChainResult chain) const {
    if (chain.is_error()) {
        result.failures.push_back({symbol, chain.error()->code(), chain.error()->what()});
        return;
    }

    std::vector<OptionQuote> quotes = chain.take_value();
    if (quotes.empty()) {
        result.failures.push_back({symbol, ErrorCode::DATA_NOT_FOUND,
                                   "Empty option chain for " + symbol + " on " +
                                       core::format_date(result.snapshot.date)});
        return;
    }

    for (const auto& quote : quotes) {
        if (quote.underlying_price > 0.0) {
            result.snapshot.underlying_prices[symbol] = quote.underlying_price;
            break;
        }
    }
    result.snapshot.chains[symbol] = std::move(quotes);
}

bool SnapshotFetcher::start_request(SnapshotFetchResult& result, const std::string& symbol,
                                    const Timestamp& date) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto previous = requests_.find(symbol);
    if (previous != requests_.end()) {
        if (previous->second.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            result.failures.push_back({symbol, ErrorCode::TIMEOUT_ERROR,
                                       "Previous request for " + symbol + " is still in flight"});
            return false;
        }
        // Late result of a timed-out request; that day has already passed
        ChainResult late = previous->second.get();
        DEBUG("Discarding late chain for " << symbol
                                           << (late.is_ok() ? "" : std::string(": ") +
                                                                       late.error()->what()));
        requests_.erase(previous);
    }

    std::shared_ptr<MarketDataProvider> provider = provider_;
    try {
        requests_[symbol] = std::async(std::launch::async, [provider, symbol, date]() {
            return load_chain(*provider, symbol, date);
        });
    } catch (const std::system_error& e) {
        result.failures.push_back({symbol, ErrorCode::MARKET_DATA_ERROR,
                                   std::string("Failed to start fetch worker: ") + e.what()});
        return false;
    }
    return true;
}

void SnapshotFetcher::collect(SnapshotFetchResult& result, const std::string& symbol,
                              std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(symbol);
    if (it == requests_.end()) {
        return;
    }
    if (it->second.wait_until(deadline) != std::future_status::ready) {
        WARN("Timed out fetching option chain for " << symbol << " on "
                                                    << core::format_date(result.snapshot.date));
        result.failures.push_back(
            {symbol, ErrorCode::TIMEOUT_ERROR,
             "Timed out after " + std::to_string(config_.timeout.count()) + " ms"});
        return;
    }
    ChainResult chain = it->second.get();
    requests_.erase(it);
    add_chain(result, symbol, std::move(chain));
}

SnapshotFetchResult SnapshotFetcher::fetch(const std::vector<std::string>& symbols,
                                           const Timestamp& date) {
    SnapshotFetchResult result;
    result.snapshot.date = date;

    if (!config_.parallel_fetch) {
        for (const auto& symbol : symbols) {
            if (start_request(result, symbol, date)) {
                collect(result, symbol, std::chrono::steady_clock::now() + config_.timeout);
            }
        }
        return result;
    }

    std::vector<std::string> started;
    started.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        if (start_request(result, symbol, date)) {
            started.push_back(symbol);
        }
    }

    auto deadline = std::chrono::steady_clock::now() + config_.timeout;
    for (const auto& symbol : started) {
        collect(result, symbol, deadline);
    }
    return result;
}

size_t SnapshotFetcher::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

}  // namespace optsim
