#include "ghappauth/exchange.hpp"
#include "ghappauth/assertion.hpp"
#include "ghappauth/json.hpp"

#include <glog/logging.h>

namespace ghappauth {
namespace exchange {

std::string access_tokens_path(uint64_t installation_id) {
    return "/app/installations/" + std::to_string(installation_id) + "/access_tokens";
}

Result<ExchangeResponse> exchange_assertion(http::HttpClientInterface& client,
                                            const AuthParams& params,
                                            const std::string& assertion) {
    http::Request request;
    request.method = http::Method::POST;
    request.path = access_tokens_path(params.installation_id);
    request.headers.emplace("Authorization", "Bearer " + assertion);
    request.headers.emplace("Accept", MACHINE_MAN_PREVIEW);

    VLOG(1) << "Requesting installation token: POST " << request.path;

    auto response = client.send(request);

    if (!response.success) {
        Error err;
        err.code = ErrorCode::RequestError;
        err.http_status = response.status_code;
        err.response_body = response.body;
        if (!response.error_message.empty()) {
            err.message = response.error_message;
        } else {
            err.message = "Installation token request failed with HTTP status " +
                          std::to_string(response.status_code);
        }
        return Result<ExchangeResponse>::error(std::move(err));
    }

    auto parsed = json::parse_exchange_response(response.body);
    if (parsed.is_ok()) {
        VLOG(1) << "Installation token for installation " << params.installation_id
                << " expires at " << json::format_timestamp(parsed.value().expires_at);
    }
    return parsed;
}

Result<ExchangeResponse> get_installation_token(http::HttpClientInterface& client,
                                                const AuthParams& params,
                                                const ClockInterface& clock) {
    auto jwt = assertion::build(params, clock.now());
    if (jwt.is_error()) {
        return Result<ExchangeResponse>::error(jwt.error());
    }

    return exchange_assertion(client, params, jwt.value());
}

}  // namespace exchange
}  // namespace ghappauth
