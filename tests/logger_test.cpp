#include "test_macros.h"

#include "log_capture.h"
#include "logger.h"

TEST_MAIN_STATE;

static void test_min_level_filters()
{
    log_capture::reset(LogLevel::WARN);
    LOG_DEBUG(LogDomain::SYSTEM, "debug %d", 1);
    LOG_INFO(LogDomain::SYSTEM, "info %d", 2);
    LOG_WARN(LogDomain::SYSTEM, "warn %d", 3);
    LOG_ERROR(LogDomain::SYSTEM, "error %d", 4);
    EXPECT_EQ_INT(log_capture::s_count, 2);
    EXPECT_STREQ(log_capture::s_entries[0].msg, "warn 3");

    logger_setMinLevel(LogLevel::DEBUG);
    LOG_DEBUG(LogDomain::SYSTEM, "debug again");
    EXPECT_EQ_INT(log_capture::s_count, 3);
}

static void test_throttle_per_key()
{
    log_capture::reset();
    for (int i = 0; i < 5; ++i)
    {
        LOG_WARN_EVERY("k1", 1000, LogDomain::MQTT, "throttled %d", i);
    }
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "throttled"), 1);

    LOG_WARN_EVERY("k2", 1000, LogDomain::MQTT, "other key");
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "other key"), 1);

    log_capture::s_clockMs = 999;
    LOG_WARN_EVERY("k1", 1000, LogDomain::MQTT, "throttled late");
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "throttled late"), 0);

    log_capture::s_clockMs = 1000;
    LOG_WARN_EVERY("k1", 1000, LogDomain::MQTT, "throttled again");
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "throttled again"), 1);
}

static void test_format_line()
{
    const LogRecord rec{65000, LogLevel::WARN, LogDomain::MQTT, "MQTT disconnected state=-3"};
    char line[128];
    const size_t n = logger_formatLine(rec, false, line, sizeof(line));
    EXPECT_STREQ(line, "[    65] WARNING MQTT      : MQTT disconnected state=-3");
    EXPECT_EQ_INT(n, std::strlen(line));

    char small[16];
    logger_formatLine(rec, false, small, sizeof(small));
    EXPECT_EQ_INT(std::strlen(small), sizeof(small) - 1);
    EXPECT_TRUE(std::strcmp(small + sizeof(small) - 4, "...") == 0);
}

static void test_format_json_escapes()
{
    const LogRecord rec{2500, LogLevel::INFO, LogDomain::TELEMETRY, "payload={\"t\":1}\n"};
    char out[128];
    EXPECT_TRUE(logger_formatJson(rec, out, sizeof(out)));
    EXPECT_STREQ(out, "{\"ts\":2,\"lvl\":\"INFO\",\"dom\":\"TELEMETRY\",\"msg\":\"payload={\\\"t\\\":1}\\n\"}");
}

static void test_long_message_is_truncated_with_marker()
{
    log_capture::reset();
    char big[400];
    std::memset(big, 'x', sizeof(big) - 1);
    big[sizeof(big) - 1] = '\0';
    LOG_INFO(LogDomain::SYSTEM, "%s", big);
    EXPECT_EQ_INT(log_capture::s_count, 1);
    const char *msg = log_capture::s_entries[0].msg;
    const size_t len = std::strlen(msg);
    EXPECT_TRUE(len < sizeof(big) - 1);
    EXPECT_TRUE(std::strcmp(msg + len - 3, "...") == 0);
}

static void test_sink_limit()
{
    logger_clearSinks();
    for (size_t i = 0; i < LOGGER_MAX_SINKS; ++i)
    {
        EXPECT_TRUE(logger_addSink(log_capture::sink));
    }
    EXPECT_FALSE(logger_addSink(log_capture::sink));
    EXPECT_FALSE(logger_addSink(nullptr));
    logger_clearSinks();
}

static void test_names()
{
    EXPECT_STREQ(logger_levelToString(LogLevel::WARN), "WARN");
    EXPECT_STREQ(logger_domainToString(LogDomain::SUPERVISOR), "SUPERVISOR");
}

int main()
{
    test_min_level_filters();
    test_throttle_per_key();
    test_format_line();
    test_format_json_escapes();
    test_long_message_is_truncated_with_marker();
    test_sink_limit();
    test_names();
    TEST_RESULT("logger_test");
}
