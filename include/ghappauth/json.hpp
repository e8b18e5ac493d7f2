#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization utilities for ghappauth types
 *
 * Uses nlohmann/json for the access_tokens response.
 */

#include "ghappauth.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ghappauth {
namespace json {

using nlohmann::json;

// ==================== Timestamp Helpers ====================

/**
 * @brief Parse an RFC 3339 / ISO 8601 timestamp
 *
 * Accepts "2016-07-11T22:14:10Z", an optional fractional part (truncated to
 * whole seconds) and numeric offsets such as "+02:00". The result is always
 * the exact UTC instant; the local timezone is never consulted.
 */
[[nodiscard]] inline std::optional<Timestamp> parse_timestamp(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    std::tm tm = {};
    std::istringstream ss(str);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (ss.fail()) {
        return std::nullopt;
    }

    auto pos = ss.tellg();
    if (pos == std::streampos(-1)) {
        // No zone designator
        return std::nullopt;
    }
    std::string rest = str.substr(static_cast<size_t>(pos));

    size_t i = 0;
    if (i < rest.size() && rest[i] == '.') {
        ++i;
        size_t digits_start = i;
        while (i < rest.size() && std::isdigit(static_cast<unsigned char>(rest[i]))) {
            ++i;
        }
        if (i == digits_start) {
            return std::nullopt;
        }
    }

    std::string zone = rest.substr(i);
    long offset_seconds = 0;
    if (zone == "Z" || zone == "z") {
        offset_seconds = 0;
    } else if (zone.size() == 6 && (zone[0] == '+' || zone[0] == '-') && zone[3] == ':') {
        for (size_t d : {1, 2, 4, 5}) {
            if (!std::isdigit(static_cast<unsigned char>(zone[d]))) {
                return std::nullopt;
            }
        }
        long hours = (zone[1] - '0') * 10 + (zone[2] - '0');
        long minutes = (zone[4] - '0') * 10 + (zone[5] - '0');
        offset_seconds = hours * 3600 + minutes * 60;
        if (zone[0] == '-') {
            offset_seconds = -offset_seconds;
        }
    } else {
        return std::nullopt;
    }

#if defined(_MSC_VER)
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    // -1 is also the valid instant 1969-12-31T23:59:59Z
    if (time == -1 && !(tm.tm_year == 69 && tm.tm_mon == 11 && tm.tm_mday == 31 &&
                        tm.tm_hour == 23 && tm.tm_min == 59 && tm.tm_sec == 59)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::from_time_t(time - offset_seconds);
}

/// Format Timestamp to ISO 8601 string (UTC)
[[nodiscard]] inline std::string format_timestamp(const Timestamp& ts) {
    auto time = std::chrono::system_clock::to_time_t(ts);
    std::tm tm = {};
#if defined(_MSC_VER)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

// ==================== Response Parsing ====================

/**
 * @brief Parse the body of POST /app/installations/{id}/access_tokens
 *
 * Requires a JSON object with a string "token" and an RFC 3339
 * "expires_at". Other fields (permissions, repository_selection, ...) are
 * ignored.
 */
[[nodiscard]] inline Result<ExchangeResponse> parse_exchange_response(const std::string& body) {
    using ParseResult = Result<ExchangeResponse>;

    try {
        auto j = json::parse(body);

        if (!j.is_object()) {
            return ParseResult::error(ErrorCode::ParseError, "Expected a JSON object");
        }

        if (!j.contains("token") || !j["token"].is_string()) {
            return ParseResult::error(ErrorCode::ParseError, "Missing string field 'token'");
        }

        if (!j.contains("expires_at") || !j["expires_at"].is_string()) {
            return ParseResult::error(ErrorCode::ParseError, "Missing string field 'expires_at'");
        }

        auto expires_at_str = j["expires_at"].get<std::string>();
        auto expires_at = parse_timestamp(expires_at_str);
        if (!expires_at) {
            return ParseResult::error(ErrorCode::ParseError,
                                      "Invalid 'expires_at' timestamp: " + expires_at_str);
        }

        ExchangeResponse response;
        response.token = j["token"].get<std::string>();
        response.expires_at = *expires_at;
        return ParseResult::ok(std::move(response));
    } catch (const nlohmann::json::exception& e) {
        return ParseResult::error(ErrorCode::ParseError,
                                  std::string("Failed to parse response: ") + e.what());
    }
}

}  // namespace json
}  // namespace ghappauth
