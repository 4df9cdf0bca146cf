// include/optsim/data/snapshot_fetcher.hpp
#pragma once

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "optsim/core/error.hpp"
#include "optsim/core/types.hpp"
#include "optsim/data/market_data_provider.hpp"

namespace optsim {

struct SnapshotFetcherConfig {
    bool parallel_fetch = true;
    std::chrono::milliseconds timeout{30000};  // Per symbol request
};

/**
 * @brief A symbol that produced no chain for the day
 */
struct FetchFailure {
    std::string symbol;
    ErrorCode code{ErrorCode::UNKNOWN_ERROR};
    std::string message;
};

struct SnapshotFetchResult {
    MarketSnapshot snapshot;
    std::vector<FetchFailure> failures;
};

/**
 * @brief Assembles a MarketSnapshot for one trading day
 *
 * Every chain request runs on a worker owned by the fetcher and is bounded by
 * the configured timeout. In parallel mode all symbols start together and
 * share one deadline; in sequential mode each symbol gets its own deadline in
 * turn. A request that misses its deadline stays in flight, and the symbol is
 * skipped on later days until it completes. The destructor waits for every
 * outstanding request.
 */
class SnapshotFetcher {
public:
    SnapshotFetcher(std::shared_ptr<MarketDataProvider> provider,
                    const SnapshotFetcherConfig& config = {});
    ~SnapshotFetcher();

    SnapshotFetcher(const SnapshotFetcher&) = delete;
    SnapshotFetcher& operator=(const SnapshotFetcher&) = delete;

    /**
     * @brief Fetch every symbol's chain for a date
     *
     * Errors, empty chains and timeouts never fail the whole fetch; the
     * symbol is left out of the snapshot and listed in failures.
     */
    SnapshotFetchResult fetch(const std::vector<std::string>& symbols, const Timestamp& date);

    /**
     * @brief Number of requests that missed their deadline and have not finished
     */
    size_t in_flight_count() const;

    const SnapshotFetcherConfig& config() const {
        return config_;
    }

private:
    using ChainFuture = std::future<Result<std::vector<OptionQuote>>>;

    bool start_request(SnapshotFetchResult& result, const std::string& symbol,
                       const Timestamp& date);
    void collect(SnapshotFetchResult& result, const std::string& symbol,
                 std::chrono::steady_clock::time_point deadline);
    void add_chain(SnapshotFetchResult& result, const std::string& symbol,
                   Result<std::vector<OptionQuote>> chain) const;

    std::shared_ptr<MarketDataProvider> provider_;
    SnapshotFetcherConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, ChainFuture> requests_;  // Started, not yet collected
};

}  // namespace optsim
