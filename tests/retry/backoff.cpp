/// @brief Exponential backoff schedule with bounded jitter

#include "agentval/retry/policy.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace agentval::retry;
using namespace std::chrono_literals;

void test_doubles_without_jitter()
{
    std::cout << "  test_doubles_without_jitter... " << std::flush;
    RetryPolicy policy;
    policy.max_jitter = 0ms;
    std::mt19937_64 rng(1);
    assert(backoff_delay(policy, 1, rng) == 500ms);
    assert(backoff_delay(policy, 2, rng) == 1000ms);
    assert(backoff_delay(policy, 3, rng) == 2000ms);
    assert(backoff_delay(policy, 5, rng) == 8000ms);
    std::cout << "PASSED\n";
}

void test_capped_at_max_delay()
{
    std::cout << "  test_capped_at_max_delay... " << std::flush;
    RetryPolicy policy;
    policy.max_jitter = 0ms;
    std::mt19937_64 rng(1);
    assert(backoff_delay(policy, 6, rng) == 10000ms);
    assert(backoff_delay(policy, 60, rng) == 10000ms);

    policy.base_delay = 0ms;
    assert(backoff_delay(policy, 4, rng) == 0ms);
    std::cout << "PASSED\n";
}

void test_jitter_bounds_and_seed()
{
    std::cout << "  test_jitter_bounds_and_seed... " << std::flush;
    RetryPolicy policy;
    std::mt19937_64 rng(42);
    for (int i = 0; i < 200; ++i)
    {
        auto d = backoff_delay(policy, 2, rng);
        assert(d >= 1000ms && d <= 1250ms);
    }

    std::mt19937_64 a(7), b(7);
    for (int attempt = 1; attempt <= 4; ++attempt)
        assert(backoff_delay(policy, attempt, a) == backoff_delay(policy, attempt, b));
    std::cout << "PASSED\n";
}

void test_max_attempts()
{
    std::cout << "  test_max_attempts... " << std::flush;
    RetryPolicy policy;
    assert(policy.max_attempts() == 3);
    policy.retries = 0;
    assert(policy.max_attempts() == 1);
    policy.retries = -4;
    assert(policy.max_attempts() == 1);
    std::cout << "PASSED\n";
}

int main()
{
    std::cout << "Backoff Tests\n";
    std::cout << "=============\n";
    test_doubles_without_jitter();
    test_capped_at_max_delay();
    test_jitter_bounds_and_seed();
    test_max_attempts();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
