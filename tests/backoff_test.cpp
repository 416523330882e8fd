#include "test_macros.h"

#include "backoff.h"

TEST_MAIN_STATE;

static BackoffPolicy noJitter()
{
    return BackoffPolicy{1000, 60000, 0};
}

static void test_nominal_doubles_until_ceiling()
{
    const BackoffPolicy p = noJitter();
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 0), 0);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 1), 1000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 2), 2000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 3), 4000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 6), 32000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 7), 60000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 8), 60000);
}

static void test_nominal_never_overflows()
{
    const BackoffPolicy p = noJitter();
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 1000), 60000);
    EXPECT_EQ_INT(backoff_nominalDelayMs(p, 0xFFFFFFFFu), 60000);

    const BackoffPolicy wide{3000000000u, 4000000000u, 0};
    EXPECT_EQ_INT(backoff_nominalDelayMs(wide, 2), 4000000000u);
}

static void test_sequence_is_monotonic_without_jitter()
{
    const BackoffPolicy p = noJitter();
    uint32_t prev = 0;
    for (uint32_t n = 1; n <= 20; ++n)
    {
        const uint32_t d = backoff_delayMs(p, n, 12345u);
        EXPECT_TRUE(d >= prev);
        EXPECT_TRUE(d <= p.maxMs);
        prev = d;
    }
    EXPECT_EQ_INT(prev, 60000);
}

static void test_jitter_stays_in_window()
{
    const BackoffPolicy p{1000, 60000, 20};
    for (uint32_t r = 0; r < 5000; r += 7)
    {
        const uint32_t d = backoff_delayMs(p, 1, r);
        EXPECT_TRUE(d >= 800 && d <= 1200);
    }
    // Ceiling holds even when jitter pushes above it.
    for (uint32_t r = 0; r < 5000; r += 11)
    {
        const uint32_t d = backoff_delayMs(p, 30, r * 2654435761u);
        EXPECT_TRUE(d >= 48000 && d <= 60000);
    }
}

static void test_jitter_extremes()
{
    const BackoffPolicy p{1000, 60000, 20};
    // span = 200, window = 401 values: r % 401 == 0 -> -200, == 400 -> +200
    EXPECT_EQ_INT(backoff_delayMs(p, 1, 0), 800);
    EXPECT_EQ_INT(backoff_delayMs(p, 1, 400), 1200);
    EXPECT_EQ_INT(backoff_delayMs(p, 1, 200), 1000);
}

static void test_full_jitter_never_zero()
{
    const BackoffPolicy p{1, 10, 100};
    for (uint32_t r = 0; r < 10; ++r)
    {
        EXPECT_TRUE(backoff_delayMs(p, 1, r) >= 1);
    }
}

static void test_default_policy_matches_config()
{
    const BackoffPolicy p = backoff_defaultPolicy();
    EXPECT_EQ_INT(p.baseMs, 1000);
    EXPECT_EQ_INT(p.maxMs, 60000);
    EXPECT_EQ_INT(p.jitterPct, 20);
}

int main()
{
    test_nominal_doubles_until_ceiling();
    test_nominal_never_overflows();
    test_sequence_is_monotonic_without_jitter();
    test_jitter_stays_in_window();
    test_jitter_extremes();
    test_full_jitter_never_zero();
    test_default_policy_matches_config();
    TEST_RESULT("backoff_test");
}
