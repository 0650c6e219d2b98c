#pragma once
#include <chrono>
#include <random>

namespace agentval::retry
{

struct RetryPolicy
{
    int retries{2};
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_jitter{250};
    std::chrono::milliseconds max_delay{10000};
    /// Budget for one generator call; zero or negative disables the timeout.
    std::chrono::milliseconds attempt_timeout{20000};

    int max_attempts() const
    {
        return retries < 0 ? 1 : retries + 1;
    }
};

/// Delay before the retry that follows failed attempt `attempt` (1-based):
/// min(base_delay * 2^(attempt-1), max_delay) + uniform jitter in [0, max_jitter].
std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt,
                                        std::mt19937_64& rng);

} // namespace agentval::retry
