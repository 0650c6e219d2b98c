#include "agentval/retry/policy.hpp"

#include <algorithm>

namespace agentval::retry
{

std::chrono::milliseconds backoff_delay(const RetryPolicy& policy, int attempt,
                                        std::mt19937_64& rng)
{
    using std::chrono::milliseconds;

    long long base = std::max<long long>(policy.base_delay.count(), 0);
    long long cap = std::max<long long>(policy.max_delay.count(), 0);
    long long delay = base;
    for (int i = 1; i < attempt && delay < cap; ++i)
        delay *= 2;
    delay = std::min(delay, cap);

    long long jitter = 0;
    if (policy.max_jitter.count() > 0)
    {
        std::uniform_int_distribution<long long> dist(0, policy.max_jitter.count());
        jitter = dist(rng);
    }
    return milliseconds(delay + jitter);
}

} // namespace agentval::retry
