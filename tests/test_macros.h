#pragma once
#include <cmath>
#include <cstdio>
#include <cstring>

// Minimal host test helpers: each test binary defines s_failures via TEST_MAIN_STATE
// and returns non-zero from main() when anything failed.

#define TEST_MAIN_STATE static int s_failures = 0

#define EXPECT_TRUE(expr)                                                                                               \
    do                                                                                                                  \
    {                                                                                                                   \
        if (!(expr))                                                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected true: %s\n", __FILE__, __LINE__, #expr);                        \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_FALSE(expr) EXPECT_TRUE(!(expr))

#define EXPECT_EQ_INT(actual, expected)                                                                                 \
    do                                                                                                                  \
    {                                                                                                                   \
        const long long _a = (long long)(actual);                                                                      \
        const long long _e = (long long)(expected);                                                                    \
        if (_a != _e)                                                                                                  \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=%lld got %lld\n", __FILE__, __LINE__, #actual, _e, _a);     \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_STREQ(actual, expected)                                                                                  \
    do                                                                                                                  \
    {                                                                                                                   \
        const char *_a = (actual);                                                                                     \
        const char *_e = (expected);                                                                                   \
        if (!_a || !_e || std::strcmp(_a, _e) != 0)                                                                    \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=\"%s\" got \"%s\"\n", __FILE__, __LINE__, #actual,           \
                         _e ? _e : "(null)", _a ? _a : "(null)");                                                      \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define EXPECT_NEAR(actual, expected, eps)                                                                              \
    do                                                                                                                  \
    {                                                                                                                   \
        const double _a = (actual);                                                                                    \
        const double _e = (expected);                                                                                  \
        if (std::fabs(_a - _e) > (eps))                                                                                \
        {                                                                                                               \
            std::fprintf(stderr, "FAIL:%s:%d expected %s=%f got %f\n", __FILE__, __LINE__, #actual, _e, _a);         \
            ++s_failures;                                                                                               \
        }                                                                                                               \
    } while (0)

#define TEST_RESULT(name)                                                                                               \
    do                                                                                                                  \
    {                                                                                                                   \
        if (s_failures != 0)                                                                                            \
        {                                                                                                               \
            std::fprintf(stderr, "%s: %d failure(s)\n", name, s_failures);                                            \
            return 1;                                                                                                   \
        }                                                                                                               \
        std::printf("%s: all tests passed\n", name);                                                                  \
        return 0;                                                                                                       \
    } while (0)
