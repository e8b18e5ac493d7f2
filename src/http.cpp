#include "ghappauth/http.hpp"

#include <httplib.h>

#include <mutex>
#include <stdexcept>

// Detect SSL support in cpp-httplib
#if defined(CPPHTTPLIB_OPENSSL_SUPPORT)
#define GHAPPAUTH_HTTP_HAS_SSL 1
#else
#define GHAPPAUTH_HTTP_HAS_SSL 0
#endif

namespace ghappauth {
namespace http {

namespace {

template <typename ClientT>
httplib::Result dispatch(ClientT& client, Method method, const std::string& path,
                         const httplib::Headers& headers, const std::string& body,
                         const std::string& content_type) {
    switch (method) {
        case Method::GET:
            return client.Get(path, headers);
        case Method::POST:
            return client.Post(path, headers, body, content_type);
        case Method::PUT:
            return client.Put(path, headers, body, content_type);
        case Method::PATCH:
            return client.Patch(path, headers, body, content_type);
        case Method::DELETE_METHOD:
            return client.Delete(path, headers);
    }
    return httplib::Result();
}

}  // namespace

// ==================== HttpClient Implementation ====================

class HttpClient::Impl {
  public:
    explicit Impl(Config config) : config_(std::move(config)) {
        if (config_.user_agent.empty()) {
            config_.user_agent = std::string("ghappauth/") + VERSION;
        }

        // Parse base URL to extract host and port
        std::string url = config_.base_url;

        while (!url.empty() && url.back() == '/') {
            url.pop_back();
        }

        bool use_https = false;
        if (url.substr(0, 8) == "https://") {
            use_https = true;
            url = url.substr(8);
        } else if (url.substr(0, 7) == "http://") {
            url = url.substr(7);
        }

        std::string host;
        int port = use_https ? 443 : 80;

        auto colon_pos = url.find(':');
        auto slash_pos = url.find('/');

        if (colon_pos != std::string::npos && (slash_pos == std::string::npos || colon_pos < slash_pos)) {
            host = url.substr(0, colon_pos);
            std::string port_str;
            if (slash_pos != std::string::npos) {
                port_str = url.substr(colon_pos + 1, slash_pos - colon_pos - 1);
                base_path_ = url.substr(slash_pos);
            } else {
                port_str = url.substr(colon_pos + 1);
            }
            try {
                port = std::stoi(port_str);
            } catch (const std::exception&) {
                return;
            }
        } else {
            if (slash_pos != std::string::npos) {
                host = url.substr(0, slash_pos);
                base_path_ = url.substr(slash_pos);
            } else {
                host = url;
            }
        }

        if (host.empty()) {
            return;
        }

        if (use_https) {
#if GHAPPAUTH_HTTP_HAS_SSL
            ssl_client_ = std::make_unique<httplib::SSLClient>(host, port);
            ssl_client_->set_connection_timeout(config_.timeout_seconds);
            ssl_client_->set_read_timeout(config_.timeout_seconds);
            ssl_client_->set_write_timeout(config_.timeout_seconds);

            if (!config_.verify_ssl) {
                ssl_client_->enable_server_certificate_verification(false);
            }
#else
            // SSL not available - HTTPS URLs will fail at request time
            https_requested_ = true;
            client_ = std::make_unique<httplib::Client>(host, port);
            client_->set_connection_timeout(config_.timeout_seconds);
            client_->set_read_timeout(config_.timeout_seconds);
            client_->set_write_timeout(config_.timeout_seconds);
#endif
        } else {
            client_ = std::make_unique<httplib::Client>(host, port);
            client_->set_connection_timeout(config_.timeout_seconds);
            client_->set_read_timeout(config_.timeout_seconds);
            client_->set_write_timeout(config_.timeout_seconds);
        }

        configured_ = true;
    }

    Response send(const Request& request) {
        std::lock_guard<std::mutex> lock(mutex_);

        Response response;

        if (!configured_) {
            response.error_message = "HTTP client not configured: invalid base URL '" +
                                     config_.base_url + "'";
            return response;
        }

#if !GHAPPAUTH_HTTP_HAS_SSL
        if (https_requested_) {
            response.error_message = "HTTPS not supported: cpp-httplib was compiled without SSL support";
            return response;
        }
#endif

        std::string full_path = base_path_ + request.path;

        httplib::Headers headers;
        if (!has_header(request.headers, "User-Agent")) {
            headers.emplace("User-Agent", config_.user_agent);
        }
        for (const auto& [name, value] : request.headers) {
            headers.emplace(name, value);
        }

        httplib::Result result;
#if GHAPPAUTH_HTTP_HAS_SSL
        if (ssl_client_) {
            result = dispatch(*ssl_client_, request.method, full_path, headers, request.body,
                              request.content_type);
        } else {
            result = dispatch(*client_, request.method, full_path, headers, request.body,
                              request.content_type);
        }
#else
        result = dispatch(*client_, request.method, full_path, headers, request.body,
                          request.content_type);
#endif

        if (result) {
            response.status_code = result->status;
            response.body = result->body;
            response.success = (result->status >= 200 && result->status < 300);
            return response;
        }

        switch (result.error()) {
            case httplib::Error::Connection:
                response.error_message = "Connection failed";
                break;
            case httplib::Error::Read:
                response.error_message = "Read failed";
                break;
            case httplib::Error::Write:
                response.error_message = "Write failed";
                break;
#if GHAPPAUTH_HTTP_HAS_SSL
            case httplib::Error::SSLConnection:
                response.error_message = "SSL connection failed";
                break;
            case httplib::Error::SSLServerVerification:
                response.error_message = "SSL certificate verification failed";
                break;
#endif
            default:
                response.error_message = "Unknown network error";
        }

        return response;
    }

    bool is_configured() const { return configured_; }

    const std::string& base_url() const { return config_.base_url; }

    const std::string& user_agent() const { return config_.user_agent; }

  private:
    Config config_;
    std::string base_path_;
    std::unique_ptr<httplib::Client> client_;
#if GHAPPAUTH_HTTP_HAS_SSL
    std::unique_ptr<httplib::SSLClient> ssl_client_;
#else
    bool https_requested_ = false;
#endif
    bool configured_ = false;
    std::mutex mutex_;
};

HttpClient::HttpClient(Config config) : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Response HttpClient::send(const Request& request) {
    return impl_->send(request);
}

bool HttpClient::is_configured() const {
    return impl_->is_configured();
}

const std::string& HttpClient::base_url() const {
    return impl_->base_url();
}

const std::string& HttpClient::user_agent() const {
    return impl_->user_agent();
}

}  // namespace http
}  // namespace ghappauth
