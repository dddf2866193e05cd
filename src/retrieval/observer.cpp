#include "ghostpir/retrieval/observer.hpp"
#include <iostream>
#include <iomanip>

namespace ghostpir::retrieval {

const char* to_string(TrafficCategory category) {
    switch (category) {
        case TrafficCategory::PIR:     return "PIR";
        case TrafficCategory::Auth:    return "Auth";
        case TrafficCategory::Catalog: return "Catalog";
        case TrafficCategory::Other:   return "Other";
    }
    return "Other";
}

// ============================================================================
// ObserverGroup Implementation
// ============================================================================

void ObserverGroup::add(std::shared_ptr<RetrievalObserver> observer) {
    if (observer) {
        observers_.push_back(std::move(observer));
    }
}

void ObserverGroup::on_state_change(RetrieverState from, RetrieverState to) {
    for (auto& o : observers_) o->on_state_change(from, to);
}

void ObserverGroup::on_progress(size_t chunks_done, size_t total) {
    for (auto& o : observers_) o->on_progress(chunks_done, total);
}

void ObserverGroup::on_traffic(const TrafficEvent& event) {
    for (auto& o : observers_) o->on_traffic(event);
}

void ObserverGroup::on_session_refresh() {
    for (auto& o : observers_) o->on_session_refresh();
}

void ObserverGroup::on_error(const RetrievalError& error) {
    for (auto& o : observers_) o->on_error(error);
}

// ============================================================================
// TrafficObserver Implementation
// ============================================================================

void TrafficObserver::on_traffic(const TrafficEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    overall_.request_bytes += event.request_bytes;
    overall_.response_bytes += event.response_bytes;
    overall_.count += 1;

    auto& bucket = by_category_[event.category];
    bucket.request_bytes += event.request_bytes;
    bucket.response_bytes += event.response_bytes;
    bucket.count += 1;

    last_event_ = event;
}

void TrafficObserver::on_session_refresh() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++session_refreshes_;
}

TrafficObserver::Totals TrafficObserver::overall() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return overall_;
}

TrafficObserver::Totals TrafficObserver::for_category(TrafficCategory category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_category_.find(category);
    return it == by_category_.end() ? Totals{} : it->second;
}

std::optional<TrafficEvent> TrafficObserver::last_event() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_event_;
}

size_t TrafficObserver::session_refreshes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_refreshes_;
}

void TrafficObserver::print_statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::cout << "\n╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║                 Retrieval Traffic Statistics               ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝\n";

    std::cout << "Requests:          " << overall_.count << "\n";
    std::cout << "Bytes sent:        " << overall_.request_bytes << "\n";
    std::cout << "Bytes received:    " << overall_.response_bytes << "\n";
    std::cout << "Session refreshes: " << session_refreshes_ << "\n";

    for (const auto& [category, totals] : by_category_) {
        std::cout << "  " << std::left << std::setw(8) << to_string(category)
                  << std::right << std::setw(6) << totals.count << " req  "
                  << std::setw(10) << totals.request_bytes << " B out  "
                  << std::setw(10) << totals.response_bytes << " B in\n";
    }
    std::cout << std::endl;
}

void TrafficObserver::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    overall_ = Totals{};
    by_category_.clear();
    last_event_.reset();
    session_refreshes_ = 0;
}

// ============================================================================
// ConsoleObserver Implementation
// ============================================================================

void ConsoleObserver::on_state_change(RetrieverState from, RetrieverState to) {
    std::cout << "[" << tag_ << "] " << to_string(from) << " -> " << to_string(to) << std::endl;
}

void ConsoleObserver::on_progress(size_t chunks_done, size_t total) {
    std::cout << "[" << tag_ << "] Recovered chunk " << chunks_done << "/" << total << std::endl;
}

void ConsoleObserver::on_session_refresh() {
    std::cout << "[" << tag_ << "] Refreshing session token..." << std::endl;
}

void ConsoleObserver::on_error(const RetrievalError& error) {
    std::cerr << "[" << tag_ << "] " << to_string(error.kind) << ": " << error.message;
    if (error.chunk_index) {
        std::cerr << " (chunk " << *error.chunk_index << ")";
    }
    std::cerr << std::endl;
}

} // namespace ghostpir::retrieval
