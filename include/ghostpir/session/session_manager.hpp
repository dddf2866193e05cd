#pragma once

#include "ghostpir/core/types.hpp"
#include "ghostpir/network/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>

namespace ghostpir::session {

/// Wall-clock source; injectable for tests
using NowFn = std::function<TimePoint()>;

// ============================================================================
// Session Manager
// ============================================================================

/// Obtains bearer tokens and replaces them before the server-side TTL runs
/// out. Refresh is synchronous and happens only between chunk requests.
class SessionManager {
private:
    std::shared_ptr<network::PirTransport> transport_;
    std::chrono::milliseconds ttl_;
    std::chrono::milliseconds margin_;
    NowFn now_;

public:
    /// Throws ConfigError unless 0 < margin < ttl
    SessionManager(std::shared_ptr<network::PirTransport> transport,
                   std::chrono::milliseconds ttl,
                   std::chrono::milliseconds margin,
                   NowFn now = [] { return Clock::now(); });

    /// One round trip to POST /session; the token is stamped with now()
    SessionToken create(const std::string& identity);

    /// Whether a token issued at issued_at must be replaced at time now
    bool needs_refresh(const SessionToken& token, TimePoint now) const {
        return token.empty() || (now - token.issued_at) > margin_;
    }

    /// Returns a fresh token if the margin has elapsed, else token unchanged
    SessionToken refresh_if_needed(const SessionToken& token,
                                   const std::string& identity,
                                   TimePoint now);

    TimePoint now() const { return now_(); }

    std::chrono::milliseconds ttl() const { return ttl_; }
    std::chrono::milliseconds margin() const { return margin_; }
};

} // namespace ghostpir::session
