#pragma once

#include "ghostpir/core/config.hpp"
#include "ghostpir/network/transport.hpp"
#include "ghostpir/retrieval/chunk_retriever.hpp"
#include "ghostpir/retrieval/module_cache.hpp"
#include "ghostpir/retrieval/observer.hpp"
#include "ghostpir/retrieval/state.hpp"
#include "ghostpir/session/session_manager.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <string>

namespace ghostpir::retrieval {

// ============================================================================
// Module Fetcher
// ============================================================================

/// Public retrieval surface: cache lookup, then a full private download.
///
/// One download at a time; a second concurrent call throws BusyError.
/// The fetcher must outlive any future returned by fetch_module_async().
class ModuleFetcher {
private:
    ClientConfig config_;
    std::shared_ptr<network::PirTransport> transport_;
    std::shared_ptr<ModuleCache> cache_;
    std::shared_ptr<RetrievalObserver> observer_;
    std::shared_ptr<session::SessionManager> session_;
    ChunkRetriever retriever_;
    std::atomic<bool> busy_;

public:
    /// Throws ConfigError if config does not validate
    ModuleFetcher(const ClientConfig& config,
                  std::shared_ptr<network::PirTransport> transport,
                  std::shared_ptr<ModuleCache> cache = nullptr,
                  std::shared_ptr<RetrievalObserver> observer = nullptr,
                  session::NowFn now = [] { return Clock::now(); });

    ModuleFetcher(const ModuleFetcher&) = delete;
    ModuleFetcher& operator=(const ModuleFetcher&) = delete;

    /// Fetcher talking HTTP to config.base_url
    static std::unique_ptr<ModuleFetcher> connect(
        const ClientConfig& config,
        std::shared_ptr<ModuleCache> cache = nullptr,
        std::shared_ptr<RetrievalObserver> observer = nullptr);

    /// Blocking fetch. Served from the cache when possible; otherwise every
    /// chunk is retrieved privately and the result cached on success.
    FetchResult fetch_module(const std::string& module_id);

    /// fetch_module() on a worker thread
    std::future<FetchResult> fetch_module_async(const std::string& module_id);

    /// Restart the last failed download from chunk 0
    FetchResult retry();

    /// Abort the running download at its next step
    void cancel() { retriever_.cancel(); }

    bool busy() const { return busy_.load(std::memory_order_acquire); }

    const ClientConfig& config() const { return config_; }
    const std::shared_ptr<ModuleCache>& cache() const { return cache_; }
    const std::shared_ptr<RetrievalObserver>& observer() const { return observer_; }
    const ChunkRetriever& retriever() const { return retriever_; }

private:
    /// Claim the fetcher; throws BusyError if already claimed
    void acquire();
    void release() { busy_.store(false, std::memory_order_release); }

    FetchResult fetch_locked(const std::string& module_id);
    FetchResult run_to_completion();
};

} // namespace ghostpir::retrieval
