#pragma once

/**
 * @file http.hpp
 * @brief HTTP client abstraction for ghappauth
 *
 * Provides a small HTTP client interface using cpp-httplib under the hood.
 * The same client refreshes installation tokens and may be reused by callers
 * for their own GitHub API requests.
 */

#include "ghappauth.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <string>

namespace ghappauth {
namespace http {

/// HTTP method
enum class Method { GET, POST, PUT, PATCH, DELETE_METHOD };

/// HTTP response structure
struct Response {
    int status_code = 0;
    std::string body;
    bool success = false;
    std::string error_message;
};

/// HTTP request structure
struct Request {
    Method method = Method::GET;
    std::string path;
    std::string body;
    std::string content_type = "application/json";
    Headers headers;
};

/**
 * @brief HTTP client interface
 *
 * Abstract interface for HTTP operations. Can be mocked for testing.
 */
class HttpClientInterface {
  public:
    virtual ~HttpClientInterface() = default;

    /// Send an HTTP request and return the response. Exactly one attempt is
    /// made; transport failures are reported through Response::error_message.
    [[nodiscard]] virtual Response send(const Request& request) = 0;

    /// Check if the client is properly configured
    [[nodiscard]] virtual bool is_configured() const = 0;
};

/**
 * @brief HTTP client using cpp-httplib
 *
 * Implements HttpClientInterface using cpp-httplib for actual HTTP communication.
 * Supports HTTPS with SSL certificate verification. send() is serialized by an
 * internal mutex so one client can be shared between threads.
 */
class HttpClient : public HttpClientInterface {
  public:
    /// Configuration for the HTTP client
    struct Config {
        std::string base_url;
        std::string user_agent;
        int timeout_seconds = 30;
        bool verify_ssl = true;
    };

    /// Construct with configuration
    explicit HttpClient(Config config);

    /// Destructor
    ~HttpClient() override;

    // Non-copyable
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Movable
    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /// Send an HTTP request
    [[nodiscard]] Response send(const Request& request) override;

    /// Check if properly configured
    [[nodiscard]] bool is_configured() const override;

    /// Get the base URL
    [[nodiscard]] const std::string& base_url() const;

    /// Get the User-Agent sent with every request
    [[nodiscard]] const std::string& user_agent() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/// Check that a string is a valid HTTP header value (visible ASCII, space
/// and horizontal tab only)
[[nodiscard]] inline bool is_valid_header_value(const std::string& value) noexcept {
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\t') {
            continue;
        }
        if (c < 0x20 || c >= 0x7f) {
            return false;
        }
    }
    return true;
}

/// Check whether `headers` has a field called `name`. Field names are
/// case-insensitive.
[[nodiscard]] inline bool has_header(const Headers& headers, const std::string& name) noexcept {
    for (const auto& field : headers) {
        const std::string& key = field.first;
        if (key.size() == name.size() &&
            std::equal(key.begin(), key.end(), name.begin(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) ==
                       std::tolower(static_cast<unsigned char>(b));
            })) {
            return true;
        }
    }
    return false;
}

}  // namespace http
}  // namespace ghappauth
