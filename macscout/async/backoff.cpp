#include "backoff.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "macscout/error/exception.hpp"

namespace macscout::async {

namespace {
// 2^62 ms is already far beyond any sensible cap.
constexpr uint32_t MAX_SHIFT = 62;
}

auto strategyToString(BackoffStrategy strategy) noexcept -> std::string_view {
    switch (strategy) {
        case BackoffStrategy::Linear:
            return "linear";
        case BackoffStrategy::Exponential:
            return "exponential";
    }
    return "unknown";
}

auto strategyFromString(std::string_view name)
    -> std::optional<BackoffStrategy> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "linear") {
        return BackoffStrategy::Linear;
    }
    if (lower == "exponential") {
        return BackoffStrategy::Exponential;
    }
    return std::nullopt;
}

BackoffPolicy::BackoffPolicy(const BackoffConfig& config) : config_(config) {
    if (!config_.isValid()) {
        THROW_INVALID_ARGUMENT("Invalid backoff: base ", config.base.count(),
                               " ms, max ", config.max_delay.count(), " ms");
    }
}

auto BackoffPolicy::delay(uint32_t failed_attempts) const noexcept
    -> std::chrono::milliseconds {
    if (failed_attempts == 0 || config_.base.count() == 0) {
        return std::chrono::milliseconds(0);
    }

    const auto base = static_cast<uint64_t>(config_.base.count());
    const auto cap = static_cast<uint64_t>(config_.max_delay.count());
    uint64_t factor = 0;
    switch (config_.strategy) {
        case BackoffStrategy::Linear:
            factor = failed_attempts;
            break;
        case BackoffStrategy::Exponential:
            factor = uint64_t{1}
                     << std::min(failed_attempts - 1, MAX_SHIFT);
            break;
    }

    if (factor > cap / base) {
        return config_.max_delay;
    }
    return std::chrono::milliseconds(std::min(base * factor, cap));
}

}  // namespace macscout::async
