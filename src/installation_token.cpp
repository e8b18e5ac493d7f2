#include "ghappauth/ghappauth.hpp"
#include "ghappauth/clock.hpp"
#include "ghappauth/exchange.hpp"
#include "ghappauth/http.hpp"

#include <glog/logging.h>

#include <memory>
#include <utility>

namespace ghappauth {

Result<void> validate_params(const AuthParams& params) {
    if (params.user_agent.empty()) {
        return Result<void>::error(ErrorCode::InvalidParameter, "User agent is required");
    }
    if (params.private_key.empty()) {
        return Result<void>::error(ErrorCode::InvalidParameter, "Private key is required");
    }
    return Result<void>::ok();
}

// PIMPL implementation
class InstallationToken::Impl {
  public:
    Impl(AuthParams params, std::shared_ptr<http::HttpClientInterface> client,
         std::shared_ptr<ClockInterface> clock, std::string token, Timestamp fetch_time)
        : params_(std::move(params)),
          client_(std::move(client)),
          clock_(std::move(clock)),
          token_(std::move(token)),
          fetch_time_(fetch_time) {}

    Result<Headers> header() {
        auto refreshed = refresh();
        if (refreshed.is_error()) {
            return Result<Headers>::error(refreshed.error());
        }

        std::string value = "token " + token_;
        if (!http::is_valid_header_value(value)) {
            return Result<Headers>::error(ErrorCode::HeaderEncodingError,
                                          "Installation token is not a valid header value");
        }

        Headers headers;
        headers.emplace("Authorization", std::move(value));
        return Result<Headers>::ok(std::move(headers));
    }

    const std::string& token() const noexcept { return token_; }

    Timestamp fetch_time() const noexcept { return fetch_time_; }

    const AuthParams& params() const noexcept { return params_; }

    const std::shared_ptr<http::HttpClientInterface>& client() const noexcept { return client_; }

  private:
    // Token and fetch time are only assigned after a successful exchange.
    Result<void> refresh() {
        auto elapsed = elapsed_between(fetch_time_, clock_->now());
        if (elapsed.is_error()) {
            return Result<void>::error(elapsed.error());
        }

        if (!InstallationToken::is_stale(elapsed.value())) {
            return Result<void>::ok();
        }

        LOG(INFO) << "Refreshing installation token for installation "
                  << params_.installation_id;

        auto raw = exchange::get_installation_token(*client_, params_, *clock_);
        if (raw.is_error()) {
            return Result<void>::error(raw.error());
        }

        token_ = std::move(raw.value().token);
        fetch_time_ = clock_->now();
        return Result<void>::ok();
    }

    AuthParams params_;
    std::shared_ptr<http::HttpClientInterface> client_;
    std::shared_ptr<ClockInterface> clock_;
    std::string token_;
    Timestamp fetch_time_;
};

// ==================== InstallationToken ====================

Result<InstallationToken> InstallationToken::create(AuthParams params, Config config) {
    auto valid = validate_params(params);
    if (valid.is_error()) {
        return Result<InstallationToken>::error(valid.error());
    }

    http::HttpClient::Config http_config;
    http_config.base_url = config.api_url;
    http_config.user_agent = params.user_agent;
    http_config.timeout_seconds = config.timeout_seconds;
    http_config.verify_ssl = config.verify_ssl;

    return create(std::move(params), std::make_shared<http::HttpClient>(std::move(http_config)),
                  std::make_shared<SystemClock>());
}

Result<InstallationToken> InstallationToken::create(AuthParams params,
                                                    std::shared_ptr<http::HttpClientInterface> client,
                                                    std::shared_ptr<ClockInterface> clock) {
    auto valid = validate_params(params);
    if (valid.is_error()) {
        return Result<InstallationToken>::error(valid.error());
    }

    if (!client) {
        return Result<InstallationToken>::error(ErrorCode::InvalidParameter,
                                                "HTTP client is required");
    }

    if (!clock) {
        clock = std::make_shared<SystemClock>();
    }

    auto raw = exchange::get_installation_token(*client, params, *clock);
    if (raw.is_error()) {
        return Result<InstallationToken>::error(raw.error());
    }

    Timestamp fetch_time = clock->now();
    auto impl = std::make_unique<Impl>(std::move(params), std::move(client), std::move(clock),
                                       std::move(raw.value().token), fetch_time);
    return Result<InstallationToken>::ok(InstallationToken(std::move(impl)));
}

InstallationToken::InstallationToken(std::unique_ptr<Impl> impl) : impl_(std::move(impl)) {}

InstallationToken::~InstallationToken() = default;

InstallationToken::InstallationToken(InstallationToken&&) noexcept = default;
InstallationToken& InstallationToken::operator=(InstallationToken&&) noexcept = default;

Result<Headers> InstallationToken::header() {
    return impl_->header();
}

const std::string& InstallationToken::token() const noexcept {
    return impl_->token();
}

Timestamp InstallationToken::fetch_time() const noexcept {
    return impl_->fetch_time();
}

const AuthParams& InstallationToken::params() const noexcept {
    return impl_->params();
}

std::shared_ptr<http::HttpClientInterface> InstallationToken::client() const noexcept {
    return impl_->client();
}

}  // namespace ghappauth
