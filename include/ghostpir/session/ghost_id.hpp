#pragma once

#include <string>

namespace ghostpir::session {

/// Salt appended before hashing credentials
inline constexpr const char* kGhostSalt = "ghost-salt-2026";

/// Pseudonymous identity derived locally from credentials:
/// lowercase hex SHA-256(username || password || salt).
/// Nothing about the credentials leaves the client.
std::string derive_ghost_id(const std::string& username, const std::string& password);

} // namespace ghostpir::session
