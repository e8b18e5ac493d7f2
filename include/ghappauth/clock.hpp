#pragma once

/**
 * @file clock.hpp
 * @brief Time source for ghappauth
 *
 * The clock is injected into InstallationToken so that token age can be
 * controlled in tests.
 */

#include "ghappauth.hpp"

#include <chrono>
#include <cstdint>

namespace ghappauth {

/**
 * @brief Wall-clock time source interface
 */
class ClockInterface {
  public:
    virtual ~ClockInterface() = default;

    /// Get the current time
    [[nodiscard]] virtual Timestamp now() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public ClockInterface {
  public:
    [[nodiscard]] Timestamp now() const override;
};

/// Whole seconds since the Unix epoch. Fails with TimeError before the epoch.
[[nodiscard]] Result<uint64_t> seconds_since_epoch(const Timestamp& ts);

/// Whole seconds from `earlier` to `later`. Fails with TimeError if `later`
/// precedes `earlier`.
[[nodiscard]] Result<std::chrono::seconds> elapsed_between(const Timestamp& earlier,
                                                           const Timestamp& later);

}  // namespace ghappauth
