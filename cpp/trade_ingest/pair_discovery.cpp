#include "pair_discovery.hpp"
#include "../utils/constants.hpp"
#include "../utils/error_handling.hpp"
#include "../utils/logging/log_helper.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace trade_ingest {

namespace {
const char* kComponent = "PAIR_DISCOVERY";

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}
}

PairDiscovery::PairDiscovery(const IngestConfig& config,
                             std::shared_ptr<IRankingSource> ranking_source,
                             std::shared_ptr<IExchangeDataFetcher> exchange_source)
    : fallback_pairs_(config.fallback_pairs)
    , quote_assets_(config.quote_assets)
    , pair_limit_(static_cast<size_t>(config.pair_limit))
    , ranking_top_n_(config.ranking_top_n)
    , refresh_interval_(config.refresh_interval_seconds)
    , ranking_source_(std::move(ranking_source))
    , exchange_source_(std::move(exchange_source)) {
    PairList initial = fallback_pairs_;
    if (initial.size() > pair_limit_) {
        initial.resize(pair_limit_);
    }
    pairs_ = std::make_shared<const PairList>(std::move(initial));
    status_.pair_count = pairs_->size();
}

PairDiscovery::~PairDiscovery() {
    stop();
}

PairDiscovery::PairList PairDiscovery::get_pairs() const {
    return *get_snapshot();
}

PairDiscovery::Snapshot PairDiscovery::get_snapshot() const {
    std::lock_guard<std::mutex> lock(pairs_mutex_);
    return pairs_;
}

size_t PairDiscovery::get_pair_count() const {
    return get_snapshot()->size();
}

bool PairDiscovery::refresh_pairs() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    if (!ranking_source_ || !exchange_source_) {
        record_failure("discovery sources not configured");
        return false;
    }

    error_handling::Result<std::vector<std::string>> ranked =
        error_handling::Result<std::vector<std::string>>::error("not fetched");
    error_handling::Result<std::vector<ExchangeSymbolInfo>> symbols =
        error_handling::Result<std::vector<ExchangeSymbolInfo>>::error("not fetched");

    bool fetched = error_handling::safe_execute_void([&]() {
        ranked = ranking_source_->get_top_assets(ranking_top_n_);
        if (ranked.is_success()) {
            symbols = exchange_source_->get_symbols();
        }
    }, kComponent, "refresh");

    if (!fetched) {
        record_failure("exception while fetching discovery sources");
        return false;
    }
    if (ranked.is_error()) {
        record_failure(ranked.with_context(ranking_source_->get_source_name()).error());
        return false;
    }
    if (symbols.is_error()) {
        record_failure(symbols.with_context(exchange_source_->get_exchange_name()).error());
        return false;
    }

    PairList selected = select_pairs(ranked.value(), symbols.value(), quote_assets_, fallback_pairs_, pair_limit_);
    auto snapshot = std::make_shared<const PairList>(std::move(selected));
    size_t count = snapshot->size();

    Snapshot previous;
    {
        std::lock_guard<std::mutex> lock(pairs_mutex_);
        previous = pairs_;
        pairs_ = snapshot;
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_refresh_ok = true;
        status_.refresh_count++;
        status_.last_refresh_time_ms = now_ms();
        status_.last_error.clear();
        status_.pair_count = count;
        first_attempt_done_ = true;
    }
    first_refresh_cv_.notify_all();

    if (*previous != *snapshot) {
        LOG_INFO_COMP(kComponent, "Working set updated: " + std::to_string(previous->size()) +
                      " -> " + std::to_string(count) + " pairs (" +
                      std::to_string(ranked.value().size()) + " ranked assets, " +
                      std::to_string(symbols.value().size()) + " exchange symbols)");
    } else {
        LOG_DEBUG_COMP(kComponent, "Working set unchanged (" + std::to_string(count) + " pairs)");
    }
    return true;
}

void PairDiscovery::record_failure(const std::string& error) {
    LOG_WARN_COMP(kComponent, "Refresh failed, keeping " + std::to_string(get_pair_count()) +
                  " pairs: " + error);
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_.last_refresh_ok = false;
        status_.refresh_failures++;
        status_.last_error = error;
        first_attempt_done_ = true;
    }
    first_refresh_cv_.notify_all();
}

void PairDiscovery::start() {
    if (running_.exchange(true)) {
        return;
    }
    refresh_thread_ = std::thread(&PairDiscovery::refresh_loop, this);
    LOG_INFO_COMP(kComponent, "Started, refresh every " + std::to_string(refresh_interval_.count()) + "s");
}

void PairDiscovery::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wait_cv_.notify_all();
    if (refresh_thread_.joinable()) {
        refresh_thread_.join();
    }
    LOG_INFO_COMP(kComponent, "Stopped");
}

bool PairDiscovery::wait_for_first_refresh(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(status_mutex_);
    return first_refresh_cv_.wait_for(lock, timeout, [this] { return first_attempt_done_; });
}

PairDiscovery::Status PairDiscovery::get_status() const {
    Status status;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status = status_;
    }
    status.pair_count = get_pair_count();
    return status;
}

void PairDiscovery::refresh_loop() {
    while (running_.load()) {
        error_handling::safe_execute_void([this]() { refresh_pairs(); }, kComponent, "refresh loop");

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, refresh_interval_, [this] { return !running_.load(); });
    }
}

PairDiscovery::PairList PairDiscovery::select_pairs(const std::vector<std::string>& ranked_assets,
                                                    const std::vector<ExchangeSymbolInfo>& symbols,
                                                    const std::vector<std::string>& quote_assets,
                                                    const PairList& fallback_pairs,
                                                    size_t limit) {
    std::unordered_set<std::string> quotes(quote_assets.begin(), quote_assets.end());

    // base asset -> tradable symbols, exchange order kept
    std::unordered_map<std::string, std::vector<std::string>> by_base;
    for (const auto& info : symbols) {
        if (info.status != constants::discovery::TRADING_STATUS) continue;
        if (quotes.count(info.quote_asset) == 0) continue;
        by_base[info.base_asset].push_back(info.symbol);
    }

    PairList result;
    std::unordered_set<std::string> seen;
    auto add = [&](const std::string& pair) {
        if (result.size() < limit && seen.insert(pair).second) {
            result.push_back(pair);
        }
    };

    for (const auto& asset : ranked_assets) {
        auto it = by_base.find(asset);
        if (it == by_base.end()) continue;
        for (const auto& symbol : it->second) {
            add(symbol);
        }
    }
    for (const auto& pair : fallback_pairs) {
        add(pair);
    }
    return result;
}

} // namespace trade_ingest
