#pragma once

/**
 * @file ghappauth.hpp
 * @brief GitHub App installation token library
 *
 * Authenticates with the GitHub API as a GitHub App: the app's private key
 * signs a short-lived JWT, the JWT is exchanged for an installation token,
 * and the installation token is refreshed on use before it expires.
 */

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ghappauth {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Default GitHub REST API endpoint
constexpr const char* DEFAULT_API_URL = "https://api.github.com";

/// HTTP header fields (name -> value)
using Headers = std::map<std::string, std::string>;

/// Timestamp type used throughout the library
using Timestamp = std::chrono::system_clock::time_point;

/// Error codes returned by library operations
enum class ErrorCode {
    Success = 0,

    // The JWT could not be signed
    SigningError,

    // The token cannot be used as an HTTP header value
    HeaderEncodingError,

    // Transport failure or non-success HTTP status
    RequestError,

    // The system clock is before the reference time
    TimeError,

    // The token response could not be deserialized
    ParseError,

    // Authentication parameters failed validation
    InvalidParameter,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::SigningError:
            return "JWT encoding failed";
        case ErrorCode::HeaderEncodingError:
            return "HTTP header encoding failed";
        case ErrorCode::RequestError:
            return "HTTP request failed";
        case ErrorCode::TimeError:
            return "System time error";
        case ErrorCode::ParseError:
            return "Parse error";
        case ErrorCode::InvalidParameter:
            return "Invalid parameter";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Error detail carried by a failed Result
 *
 * http_status and response_body are only filled in for RequestError, and
 * http_status stays 0 when the request never got a response.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
    int http_status = 0;
    std::string response_body;
};

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_.code = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_.code = code;
        r.error_.message = std::move(message);
        return r;
    }

    /// Construct an error result from a full error detail
    static Result error(Error err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_.code == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_.code != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_.code; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_.message; }

    /// Get the full error detail
    [[nodiscard]] const Error& error() const noexcept { return error_; }

  private:
    Result() = default;
    std::optional<T> value_;
    Error error_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_.code = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_.code = code;
        r.error_.message = std::move(message);
        return r;
    }

    static Result error(Error err) {
        Result r;
        r.error_ = std::move(err);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_.code == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_.code != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_.code; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_.message; }
    [[nodiscard]] const Error& error() const noexcept { return error_; }

  private:
    Result() = default;
    Error error_;
};

/**
 * @brief Input parameters for authenticating as a GitHub App
 *
 * All four fields are required. They are held unchanged for the lifetime of
 * the InstallationToken built from them.
 */
struct AuthParams {
    /// User agent set on all requests to GitHub. The API rejects requests
    /// without one; GitHub asks for the app or account name.
    std::string user_agent;

    /// PEM-encoded RSA private key used to sign the JWT. Generated at the
    /// bottom of the app's settings page.
    std::vector<uint8_t> private_key;

    /// GitHub App ID, shown on the app's settings page as "App ID".
    uint64_t app_id = 0;

    /// Installation ID. This is the final path component of the
    /// installation's configuration URL, for example 1216616 in
    /// "github.com/organizations/mycoolorg/settings/installations/1216616".
    uint64_t installation_id = 0;
};

/**
 * @brief Transport configuration for InstallationToken::create
 */
struct Config {
    /// Base URL of the GitHub REST API (GitHub Enterprise: ".../api/v3")
    std::string api_url = DEFAULT_API_URL;

    /// HTTP request timeout in seconds
    int timeout_seconds = 30;

    /// Enable SSL certificate verification (disable only for testing!)
    bool verify_ssl = true;
};

/**
 * @brief Claims of the JWT that identifies the app
 */
struct AssertionClaims {
    uint64_t iat = 0;  // Issued at (Unix timestamp)
    uint64_t exp = 0;  // Expires at (Unix timestamp)
    uint64_t iss = 0;  // GitHub App ID
};

/**
 * @brief Body of the access_tokens response
 */
struct ExchangeResponse {
    std::string token;
    Timestamp expires_at;
};

/// Installation tokens expire after 60 minutes; refresh after 55
constexpr std::chrono::seconds TOKEN_REFRESH_THRESHOLD{55 * 60};

/// Check that all required authentication parameters are present
[[nodiscard]] Result<void> validate_params(const AuthParams& params);

class ClockInterface;

namespace http {
class HttpClientInterface;
}  // namespace http

/**
 * @brief Installation token, the primary credential for acting as a GitHub App
 *
 * Creation fetches the first token, so an InstallationToken always holds one.
 * header() refreshes the token once it is older than
 * TOKEN_REFRESH_THRESHOLD, measured from the local time it was fetched.
 *
 * Thread Safety: none. header() mutates the stored token; callers sharing
 * one instance between threads must serialize access themselves.
 *
 * ```cpp
 * auto result = ghappauth::InstallationToken::create(params);
 * if (result.is_error()) { ... }
 * auto token = std::move(result).value();
 *
 * auto header = token.header();
 * if (header.is_ok()) {
 *     ghappauth::http::Request request;
 *     request.path = "/installation/repositories";
 *     request.headers = header.value();
 *     auto response = token.client()->send(request);
 * }
 * ```
 */
class InstallationToken {
  public:
    /// Fetch an installation token over a new HTTP client built from config
    [[nodiscard]] static Result<InstallationToken> create(AuthParams params, Config config = {});

    /// Fetch an installation token using the given transport and clock.
    /// A null clock selects SystemClock.
    [[nodiscard]] static Result<InstallationToken> create(
        AuthParams params,
        std::shared_ptr<http::HttpClientInterface> client,
        std::shared_ptr<ClockInterface> clock);

    /// Destructor
    ~InstallationToken();

    // Non-copyable
    InstallationToken(const InstallationToken&) = delete;
    InstallationToken& operator=(const InstallationToken&) = delete;

    // Movable
    InstallationToken(InstallationToken&&) noexcept;
    InstallationToken& operator=(InstallationToken&&) noexcept;

    /// Get the Authorization header for the installation token, refreshing
    /// the token first if it is stale. On a failed refresh the previous
    /// token is kept and the error is returned.
    [[nodiscard]] Result<Headers> header();

    /// Get the current token value
    [[nodiscard]] const std::string& token() const noexcept;

    /// Get the local time at which the current token was fetched
    [[nodiscard]] Timestamp fetch_time() const noexcept;

    /// Get the authentication parameters
    [[nodiscard]] const AuthParams& params() const noexcept;

    /// Get the HTTP client used for refreshes. It may be reused for other
    /// requests to the GitHub API.
    [[nodiscard]] std::shared_ptr<http::HttpClientInterface> client() const noexcept;

    /// Check whether a token fetched `elapsed` ago must be refreshed
    [[nodiscard]] static constexpr bool is_stale(std::chrono::seconds elapsed) noexcept {
        return elapsed > TOKEN_REFRESH_THRESHOLD;
    }

  private:
    class Impl;
    explicit InstallationToken(std::unique_ptr<Impl> impl);
    std::unique_ptr<Impl> impl_;
};

}  // namespace ghappauth
