#pragma once

/**
 * @file test_support.hpp
 * @brief Test doubles and key helpers shared by the ghappauth tests
 */

#include <ghappauth/clock.hpp>
#include <ghappauth/http.hpp>

#include <jwt-cpp/traits/nlohmann-json/defaults.h>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace ghappauth {
namespace testing_support {

/// Clock that only moves when told to
class ManualClock : public ClockInterface {
  public:
    explicit ManualClock(Timestamp start = std::chrono::system_clock::from_time_t(1700000000))
        : now_(start) {}

    Timestamp now() const override { return now_; }

    void advance(std::chrono::seconds by) { now_ += by; }

    void set(Timestamp ts) { now_ = ts; }

  private:
    Timestamp now_;
};

/// Transport that records requests and replays queued responses
class MockHttpClient : public http::HttpClientInterface {
  public:
    http::Response send(const http::Request& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            http::Response response;
            response.error_message = "No response queued";
            return response;
        }
        auto response = responses.front();
        responses.pop_front();
        return response;
    }

    bool is_configured() const override { return true; }

    void queue_token(const std::string& token,
                     const std::string& expires_at = "2099-01-01T00:00:00Z") {
        http::Response response;
        response.status_code = 201;
        response.success = true;
        response.body = "{\"token\":\"" + token + "\",\"expires_at\":\"" + expires_at + "\"}";
        responses.push_back(response);
    }

    void queue_status(int status, const std::string& body) {
        http::Response response;
        response.status_code = status;
        response.success = status >= 200 && status < 300;
        response.body = body;
        responses.push_back(response);
    }

    void queue_transport_error(const std::string& message) {
        http::Response response;
        response.error_message = message;
        responses.push_back(response);
    }

    std::vector<http::Request> requests;
    std::deque<http::Response> responses;
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;

inline PkeyPtr generate_key(int type, int param) {
    EVP_PKEY* pkey = nullptr;
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
        EVP_PKEY_CTX_new_id(type, nullptr), EVP_PKEY_CTX_free);
    if (ctx && EVP_PKEY_keygen_init(ctx.get()) == 1) {
        bool configured = type == EVP_PKEY_RSA
                              ? EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), param) == 1
                              : EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), param) == 1;
        if (configured) {
            EVP_PKEY_keygen(ctx.get(), &pkey);
        }
    }
    return PkeyPtr(pkey, EVP_PKEY_free);
}

/// Shared 2048-bit RSA key; generated once per test binary
inline EVP_PKEY* test_rsa_key() {
    static PkeyPtr key = generate_key(EVP_PKEY_RSA, 2048);
    return key.get();
}

/// PEM encoding (PKCS#8) of a private key
inline std::vector<uint8_t> private_key_pem(EVP_PKEY* pkey) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_PrivateKey(bio.get(), pkey, nullptr, nullptr, 0, nullptr, nullptr);
    BUF_MEM* mem = nullptr;
    BIO_get_mem_ptr(bio.get(), &mem);
    return std::vector<uint8_t>(mem->data, mem->data + mem->length);
}

inline std::vector<uint8_t> test_rsa_key_pem() {
    return private_key_pem(test_rsa_key());
}

/// Verify an RS256 signature with the public half of `pkey`
inline bool verify_rs256(const std::string& message, const std::string& signature,
                         EVP_PKEY* pkey) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, pkey) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), reinterpret_cast<const unsigned char*>(signature.data()),
                            signature.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

/// Split a compact JWT into its three segments
inline std::vector<std::string> split_jwt(const std::string& jwt) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        auto dot = jwt.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(jwt.substr(start));
            break;
        }
        parts.push_back(jwt.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

/// Decode one unpadded Base64URL JWT segment
inline std::string decode_segment(const std::string& segment) {
    return jwt::base::decode<jwt::alphabet::base64url>(
        jwt::base::pad<jwt::alphabet::base64url>(segment));
}

inline AuthParams make_params(std::vector<uint8_t> key = test_rsa_key_pem()) {
    AuthParams params;
    params.user_agent = "ghappauth-tests";
    params.private_key = std::move(key);
    params.app_id = 1234;
    params.installation_id = 5678;
    return params;
}

}  // namespace testing_support
}  // namespace ghappauth
