#pragma once

/**
 * @file assertion.hpp
 * @brief JWT that identifies a GitHub App
 *
 * The JWT is only ever sent to the access_tokens endpoint, where it is
 * exchanged for an installation token.
 */

#include "ghappauth.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ghappauth {
namespace assertion {

/// Lifetime of the JWT. A new one is signed for every exchange, so the
/// shortest window that survives the round trip limits replay.
constexpr uint64_t LIFETIME_SECONDS = 60;

/// Build the claims for a JWT issued at `now_seconds`
[[nodiscard]] AssertionClaims make_claims(const AuthParams& params, uint64_t now_seconds) noexcept;

/// Encode and sign claims as an RS256 JWT with jwt-cpp. Any failure to
/// load the key or sign is a SigningError.
[[nodiscard]] Result<std::string> encode(const AssertionClaims& claims,
                                         const std::vector<uint8_t>& private_key_pem);

/**
 * @brief Build a signed JWT for the app, issued at `now`
 *
 * @return The compact JWT, TimeError if `now` is before the epoch, or
 *         SigningError if the private key cannot sign
 */
[[nodiscard]] Result<std::string> build(const AuthParams& params, const Timestamp& now);

}  // namespace assertion
}  // namespace ghappauth
