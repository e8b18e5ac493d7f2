#include "ghappauth/assertion.hpp"
#include "ghappauth/clock.hpp"

#include <jwt-cpp/traits/nlohmann-json/defaults.h>
#include <openssl/evp.h>

#include <chrono>
#include <exception>

namespace ghappauth {
namespace assertion {

AssertionClaims make_claims(const AuthParams& params, uint64_t now_seconds) noexcept {
    AssertionClaims claims;
    claims.iat = now_seconds;
    claims.exp = now_seconds + LIFETIME_SECONDS;
    claims.iss = params.app_id;
    return claims;
}

Result<std::string> encode(const AssertionClaims& claims,
                           const std::vector<uint8_t>& private_key_pem) {
    using EncodeResult = Result<std::string>;

    if (private_key_pem.empty()) {
        return EncodeResult::error(ErrorCode::SigningError, "Private key is empty");
    }

    const std::string pem(private_key_pem.begin(), private_key_pem.end());
    const auto to_date = [](uint64_t seconds) {
        return std::chrono::system_clock::time_point(
            std::chrono::seconds(static_cast<int64_t>(seconds)));
    };

    try {
        // jwt-cpp signs with whatever key it loads; RS256 needs RSA.
        auto key = jwt::helper::load_private_key_from_string(pem);
        if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_RSA) {
            return EncodeResult::error(ErrorCode::SigningError, "RS256 requires an RSA private key");
        }

        // GitHub reads iss as the numeric app ID
        auto token = jwt::create()
                         .set_type("JWT")
                         .set_issued_at(to_date(claims.iat))
                         .set_expires_at(to_date(claims.exp))
                         .set_payload_claim("iss", jwt::claim(nlohmann::json(claims.iss)))
                         .sign(jwt::algorithm::rs256("", pem));

        return EncodeResult::ok(std::move(token));
    } catch (const std::exception& e) {
        return EncodeResult::error(ErrorCode::SigningError,
                                   std::string("Failed to sign JWT: ") + e.what());
    }
}

Result<std::string> build(const AuthParams& params, const Timestamp& now) {
    auto now_seconds = seconds_since_epoch(now);
    if (now_seconds.is_error()) {
        return Result<std::string>::error(now_seconds.error());
    }

    return encode(make_claims(params, now_seconds.value()), params.private_key);
}

}  // namespace assertion
}  // namespace ghappauth
