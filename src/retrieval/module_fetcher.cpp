#include "ghostpir/retrieval/module_fetcher.hpp"
#include <system_error>

namespace ghostpir::retrieval {

namespace {

/// Releases the fetcher's busy flag on scope exit
class BusyRelease {
    std::atomic<bool>& flag_;

public:
    explicit BusyRelease(std::atomic<bool>& flag) : flag_(flag) {}
    ~BusyRelease() { flag_.store(false, std::memory_order_release); }

    BusyRelease(const BusyRelease&) = delete;
    BusyRelease& operator=(const BusyRelease&) = delete;
};

const ClientConfig& validated(const ClientConfig& config) {
    config.validate();
    return config;
}

std::shared_ptr<RetrievalObserver> or_noop(std::shared_ptr<RetrievalObserver> observer) {
    return observer ? std::move(observer) : std::make_shared<RetrievalObserver>();
}

} // namespace

// ============================================================================
// ModuleFetcher Implementation
// ============================================================================

ModuleFetcher::ModuleFetcher(const ClientConfig& config,
                             std::shared_ptr<network::PirTransport> transport,
                             std::shared_ptr<ModuleCache> cache,
                             std::shared_ptr<RetrievalObserver> observer,
                             session::NowFn now)
    : config_(validated(config)),
      transport_(std::move(transport)),
      cache_(cache ? std::move(cache) : std::make_shared<InMemoryModuleCache>()),
      observer_(or_noop(std::move(observer))),
      session_(std::make_shared<session::SessionManager>(
          transport_, config_.session_ttl, config_.refresh_margin, std::move(now))),
      retriever_(transport_, session_, config_.identity, config_.chunk_size, observer_),
      busy_(false) {}

std::unique_ptr<ModuleFetcher> ModuleFetcher::connect(const ClientConfig& config,
                                                      std::shared_ptr<ModuleCache> cache,
                                                      std::shared_ptr<RetrievalObserver> observer) {
    observer = or_noop(std::move(observer));
    auto transport = std::make_shared<network::HttpPirTransport>(validated(config), observer);
    return std::make_unique<ModuleFetcher>(config, std::move(transport), std::move(cache),
                                           std::move(observer));
}

void ModuleFetcher::acquire() {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw BusyError();
    }
    // Cancel requests made before this claim are stale
    retriever_.clear_cancel();
}

FetchResult ModuleFetcher::fetch_module(const std::string& module_id) {
    acquire();
    BusyRelease guard(busy_);
    return fetch_locked(module_id);
}

std::future<FetchResult> ModuleFetcher::fetch_module_async(const std::string& module_id) {
    // Claimed on the caller's thread so a second call fails immediately
    acquire();
    try {
        return std::async(std::launch::async, [this, module_id] {
            BusyRelease guard(busy_);
            return fetch_locked(module_id);
        });
    } catch (const std::system_error&) {
        release();
        throw;
    }
}

FetchResult ModuleFetcher::retry() {
    acquire();
    BusyRelease guard(busy_);
    retriever_.retry();
    return run_to_completion();
}

FetchResult ModuleFetcher::fetch_locked(const std::string& module_id) {
    if (auto cached = cache_->get(module_id)) {
        return FetchResult::success(std::move(*cached), true);
    }

    // A previous failure is abandoned when a new fetch starts
    if (retriever_.state() != RetrieverState::Idle) {
        retriever_.reset();
    }

    retriever_.start(module_id);
    return run_to_completion();
}

FetchResult ModuleFetcher::run_to_completion() {
    std::string module_id = retriever_.module_id();

    while (!retriever_.finished()) {
        if (retriever_.step() == RetrieverState::Idle) {
            RetrievalError err;
            err.kind = ErrorKind::Cancelled;
            err.message = "Download of module " + module_id + " cancelled";
            observer_->on_error(err);
            return FetchResult::failure(std::move(err));
        }
    }

    if (retriever_.state() == RetrieverState::Error) {
        return FetchResult::failure(*retriever_.error());
    }

    auto artifact = retriever_.take_artifact();
    cache_->put(*artifact);
    return FetchResult::success(std::move(*artifact));
}

} // namespace ghostpir::retrieval
