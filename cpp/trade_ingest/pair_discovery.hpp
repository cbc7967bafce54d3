#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "ingest_config.hpp"
#include "../exchanges/i_exchange_data_fetcher.hpp"
#include "../ranking/i_ranking_source.hpp"

namespace trade_ingest {

/**
 * Maintains the working set of pairs to ingest
 *
 * The working set starts as the fallback list and is replaced wholesale by
 * each successful refresh. Readers get an immutable snapshot; a refresh
 * swaps the pointer in one assignment, so a reader never sees a partial
 * update.
 */
class PairDiscovery {
public:
    using PairList = std::vector<std::string>;
    using Snapshot = std::shared_ptr<const PairList>;

    struct Status {
        bool last_refresh_ok{false};
        uint64_t refresh_count{0};
        uint64_t refresh_failures{0};
        int64_t last_refresh_time_ms{0};   // 0 = never succeeded
        std::string last_error;
        size_t pair_count{0};
    };

    PairDiscovery(const IngestConfig& config,
                  std::shared_ptr<IRankingSource> ranking_source,
                  std::shared_ptr<IExchangeDataFetcher> exchange_source);
    ~PairDiscovery();

    PairDiscovery(const PairDiscovery&) = delete;
    PairDiscovery& operator=(const PairDiscovery&) = delete;

    PairList get_pairs() const;
    Snapshot get_snapshot() const;
    size_t get_pair_count() const;

    // Recomputes the working set; false (prior set kept) on any source failure
    bool refresh_pairs();

    // Background refresh: once immediately, then every refresh interval
    void start();
    void stop();
    bool is_running() const { return running_.load(); }

    // Waits until the first background refresh attempt has finished
    bool wait_for_first_refresh(std::chrono::milliseconds timeout);

    Status get_status() const;

    /**
     * Working set from source data
     *
     * Ranked assets in rank order, each expanded to its trading symbols
     * quoted in one of quote_assets, then the fallback pairs; duplicates
     * removed and the result cut to limit.
     */
    static PairList select_pairs(const std::vector<std::string>& ranked_assets,
                                 const std::vector<ExchangeSymbolInfo>& symbols,
                                 const std::vector<std::string>& quote_assets,
                                 const PairList& fallback_pairs,
                                 size_t limit);

private:
    void refresh_loop();
    void record_failure(const std::string& error);

    PairList fallback_pairs_;
    std::vector<std::string> quote_assets_;
    size_t pair_limit_;
    int ranking_top_n_;
    std::chrono::seconds refresh_interval_;

    std::shared_ptr<IRankingSource> ranking_source_;
    std::shared_ptr<IExchangeDataFetcher> exchange_source_;

    mutable std::mutex pairs_mutex_;
    Snapshot pairs_;

    mutable std::mutex status_mutex_;
    std::condition_variable first_refresh_cv_;
    bool first_attempt_done_{false};
    Status status_;

    // Serializes refresh_pairs() between the thread and direct callers
    std::mutex refresh_mutex_;

    std::atomic<bool> running_{false};
    std::thread refresh_thread_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace trade_ingest
