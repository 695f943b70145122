#pragma once
#include <string>
#include <string_view>

namespace ObsAuth {

/// Raw 32-byte SHA-256 digest. Throws std::runtime_error if OpenSSL fails.
[[nodiscard]] std::string sha256(std::string_view data);
/// Standard padded base64 of arbitrary bytes.
[[nodiscard]] std::string base64Encode(std::string_view bytes);

/**
 * obs-websocket v5 identify response:
 * base64(sha256(base64(sha256(password + salt)) + challenge))
 */
[[nodiscard]] std::string computeAuthResponse(std::string_view password,
                                              std::string_view salt,
                                              std::string_view challenge);

} // namespace ObsAuth
