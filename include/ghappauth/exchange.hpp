#pragma once

/**
 * @file exchange.hpp
 * @brief Exchange of the app JWT for an installation token
 *
 * Reference:
 * docs.github.com/en/apps/creating-github-apps/authenticating-with-a-github-app
 */

#include "ghappauth.hpp"
#include "clock.hpp"
#include "http.hpp"

#include <cstdint>
#include <string>

namespace ghappauth {
namespace exchange {

/// Media type GitHub requires on the access_tokens endpoint
constexpr const char* MACHINE_MAN_PREVIEW = "application/vnd.github.machine-man-preview+json";

/// Path of the access_tokens endpoint for an installation
[[nodiscard]] std::string access_tokens_path(uint64_t installation_id);

/**
 * @brief Exchange a signed JWT for an installation token
 *
 * Sends one POST request; the response is not cached.
 *
 * @return The parsed response, RequestError on transport failure or a
 *         non-2xx status (with status and body), or ParseError on a
 *         malformed body
 */
[[nodiscard]] Result<ExchangeResponse> exchange_assertion(http::HttpClientInterface& client,
                                                          const AuthParams& params,
                                                          const std::string& assertion);

/// Sign a fresh JWT with the app's private key and exchange it for an
/// installation token
[[nodiscard]] Result<ExchangeResponse> get_installation_token(http::HttpClientInterface& client,
                                                              const AuthParams& params,
                                                              const ClockInterface& clock);

}  // namespace exchange
}  // namespace ghappauth
