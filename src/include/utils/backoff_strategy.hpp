#pragma once
/**
 * @file backoff_strategy.hpp
 * @brief Header-only backoff strategies for retry loops.
 *
 * A strategy is any callable taking the 1-based attempt number that just failed and
 * blocking for the appropriate delay. The transaction manager stores one as a
 * `std::function<void(int)>`, so tests can inject NoBackoff (or a recording lambda)
 * and run retries without sleeping.
 *
 * Usage:
 * - TransactionManager retry loop: RetryBackoff (capped exponential)
 * - Unit tests: NoBackoff
 */
#include <algorithm>
#include <chrono>
#include <thread>

namespace kanbanhub::utils
{

/**
 * @brief Capped exponential backoff: `min(base * 2^(attempt-1), max)`.
 *
 * With the defaults (100ms, 5000ms):
 * - attempt 1: 100ms
 * - attempt 2: 200ms
 * - attempt 3: 400ms
 * - attempt 7+: 5000ms
 *
 * @example
 * RetryBackoff backoff{std::chrono::milliseconds(50), std::chrono::seconds(2)};
 * for (int attempt = 1; !try_once(); ++attempt) {
 *     backoff(attempt);
 * }
 */
struct RetryBackoff
{
    std::chrono::milliseconds base{100};
    std::chrono::milliseconds max{5000};

    /// Delay after the given failed attempt, without sleeping.
    [[nodiscard]] std::chrono::milliseconds delay_for(int attempt) const noexcept
    {
        if (attempt < 1 || base.count() <= 0)
        {
            return std::chrono::milliseconds{0};
        }
        // Cap the shift well before it can overflow; max wins long before that anyway.
        const int shift = std::min(attempt - 1, 30);
        const auto grown = base.count() * (static_cast<long long>(1) << shift);
        return std::chrono::milliseconds{std::min<long long>(grown, max.count())};
    }

    void operator()(int attempt) const
    {
        const auto d = delay_for(attempt);
        if (d.count() > 0)
        {
            std::this_thread::sleep_for(d);
        }
    }
};

/**
 * @brief No backoff - retries immediately. For tests.
 */
struct NoBackoff
{
    void operator()(int /*attempt*/) const noexcept {}
};

} // namespace kanbanhub::utils
