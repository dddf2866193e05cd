#include "ghostpir/session/session_manager.hpp"

namespace ghostpir::session {

SessionManager::SessionManager(std::shared_ptr<network::PirTransport> transport,
                               std::chrono::milliseconds ttl,
                               std::chrono::milliseconds margin,
                               NowFn now)
    : transport_(std::move(transport)), ttl_(ttl), margin_(margin), now_(std::move(now)) {
    if (!transport_) {
        throw ConfigError("SessionManager requires a transport");
    }
    if (ttl_.count() <= 0 || margin_.count() <= 0 || margin_ >= ttl_) {
        throw ConfigError("Session refresh margin must satisfy 0 < margin < TTL");
    }
    if (!now_) {
        throw ConfigError("SessionManager requires a clock");
    }
}

SessionToken SessionManager::create(const std::string& identity) {
    // Stamp before the round trip so the local estimate never lags the server
    SessionToken token;
    token.issued_at = now_();
    token.value = transport_->create_session(identity);
    return token;
}

SessionToken SessionManager::refresh_if_needed(const SessionToken& token,
                                               const std::string& identity,
                                               TimePoint now) {
    if (!needs_refresh(token, now)) {
        return token;
    }
    return create(identity);
}

} // namespace ghostpir::session
