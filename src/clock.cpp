#include "ghappauth/clock.hpp"

namespace ghappauth {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

Result<uint64_t> seconds_since_epoch(const Timestamp& ts) {
    auto since_epoch = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch());
    if (ts.time_since_epoch().count() < 0) {
        return Result<uint64_t>::error(ErrorCode::TimeError,
                                       "System time is before the Unix epoch");
    }
    return Result<uint64_t>::ok(static_cast<uint64_t>(since_epoch.count()));
}

Result<std::chrono::seconds> elapsed_between(const Timestamp& earlier, const Timestamp& later) {
    if (later < earlier) {
        return Result<std::chrono::seconds>::error(
            ErrorCode::TimeError, "System time went backwards since the token was fetched");
    }
    return Result<std::chrono::seconds>::ok(
        std::chrono::duration_cast<std::chrono::seconds>(later - earlier));
}

}  // namespace ghappauth
