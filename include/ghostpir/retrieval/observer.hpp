#pragma once

#include "ghostpir/retrieval/state.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ghostpir::retrieval {

// ============================================================================
// Traffic Events
// ============================================================================

enum class TrafficCategory : uint8_t {
    PIR,
    Auth,
    Catalog,
    Other
};

const char* to_string(TrafficCategory category);

/// One HTTP exchange with a collaborator
struct TrafficEvent {
    TrafficCategory category = TrafficCategory::Other;
    std::string method;
    std::string path;
    size_t request_bytes = 0;
    size_t response_bytes = 0;
    int status = 0;
    std::chrono::microseconds duration{0};
};

// ============================================================================
// Observer Interface
// ============================================================================

/// Injected sink for retrieval telemetry. All hooks default to no-ops.
/// Hooks are called on the thread running the download.
class RetrievalObserver {
public:
    virtual ~RetrievalObserver() = default;

    virtual void on_state_change(RetrieverState /*from*/, RetrieverState /*to*/) {}

    /// chunks_done of total chunks recovered
    virtual void on_progress(size_t /*chunks_done*/, size_t /*total*/) {}

    virtual void on_traffic(const TrafficEvent& /*event*/) {}

    virtual void on_session_refresh() {}

    virtual void on_error(const RetrievalError& /*error*/) {}
};

/// Forwards every hook to each registered observer
class ObserverGroup : public RetrievalObserver {
private:
    std::vector<std::shared_ptr<RetrievalObserver>> observers_;

public:
    void add(std::shared_ptr<RetrievalObserver> observer);

    void on_state_change(RetrieverState from, RetrieverState to) override;
    void on_progress(size_t chunks_done, size_t total) override;
    void on_traffic(const TrafficEvent& event) override;
    void on_session_refresh() override;
    void on_error(const RetrievalError& error) override;
};

// ============================================================================
// Traffic Accounting
// ============================================================================

/// Cumulative request/response byte totals, overall and per category
class TrafficObserver : public RetrievalObserver {
public:
    struct Totals {
        size_t request_bytes = 0;
        size_t response_bytes = 0;
        size_t count = 0;
    };

private:
    mutable std::mutex mutex_;
    Totals overall_;
    std::map<TrafficCategory, Totals> by_category_;
    std::optional<TrafficEvent> last_event_;
    size_t session_refreshes_ = 0;

public:
    void on_traffic(const TrafficEvent& event) override;
    void on_session_refresh() override;

    Totals overall() const;
    Totals for_category(TrafficCategory category) const;
    std::optional<TrafficEvent> last_event() const;
    size_t session_refreshes() const;

    void print_statistics() const;
    void reset();
};

// ============================================================================
// Console Logging
// ============================================================================

/// Logs transitions, progress and errors to stdout
class ConsoleObserver : public RetrievalObserver {
private:
    std::string tag_;

public:
    explicit ConsoleObserver(std::string tag = "ghostpir") : tag_(std::move(tag)) {}

    void on_state_change(RetrieverState from, RetrieverState to) override;
    void on_progress(size_t chunks_done, size_t total) override;
    void on_session_refresh() override;
    void on_error(const RetrievalError& error) override;
};

} // namespace ghostpir::retrieval
