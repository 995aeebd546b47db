/*
 * backoff.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-09-06

Description: Retry delay policy for identification attempts

**************************************************/

#ifndef MACSCOUT_ASYNC_BACKOFF_HPP
#define MACSCOUT_ASYNC_BACKOFF_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace macscout::async {

enum class BackoffStrategy : uint8_t {
    Linear,      ///< base * n
    Exponential  ///< base * 2^(n-1)
};

[[nodiscard]] auto strategyToString(BackoffStrategy strategy) noexcept
    -> std::string_view;

[[nodiscard]] auto strategyFromString(std::string_view name)
    -> std::optional<BackoffStrategy>;

struct BackoffConfig {
    BackoffStrategy strategy{BackoffStrategy::Exponential};
    std::chrono::milliseconds base{500};
    std::chrono::milliseconds max_delay{4000};

    [[nodiscard]] bool isValid() const noexcept {
        return base.count() >= 0 && max_delay >= base;
    }
};

/**
 * @brief Delay before the retry that follows the n-th failed attempt.
 *
 * Non-decreasing in n and never above max_delay.
 */
class BackoffPolicy {
public:
    BackoffPolicy() = default;

    /**
     * @throws macscout::error::InvalidArgument if the config is invalid
     */
    explicit BackoffPolicy(const BackoffConfig& config);

    [[nodiscard]] auto delay(uint32_t failed_attempts) const noexcept
        -> std::chrono::milliseconds;

    [[nodiscard]] auto config() const noexcept -> const BackoffConfig& {
        return config_;
    }

private:
    BackoffConfig config_{};
};

}  // namespace macscout::async

#endif  // MACSCOUT_ASYNC_BACKOFF_HPP
