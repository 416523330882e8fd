#include "test_macros.h"

#include "log_capture.h"
#include "publish_cycle.h"
#include "topics.h"

TEST_MAIN_STATE;

namespace
{
struct FakeTransport
{
    bool accept = true;
    int calls = 0;
    void *ctx = nullptr;
    char topic[TOPIC_MAX] = {0};
    char payload[128] = {0};
};
FakeTransport s_transport;

bool fakePublish(void *ctx, const char *topic, const char *payload)
{
    ++s_transport.calls;
    s_transport.ctx = ctx;
    std::strncpy(s_transport.topic, topic, sizeof(s_transport.topic) - 1);
    std::strncpy(s_transport.payload, payload, sizeof(s_transport.payload) - 1);
    return s_transport.accept;
}

uint32_t midRandom()
{
    return 0x80000000u;
}

PublishDeps deps()
{
    return PublishDeps{midRandom, fakePublish, &s_transport};
}
} // namespace

static void test_plan_uses_interval_when_enabled()
{
    RuntimeConfig cfg = runtime_config_defaults();
    CyclePlan plan = publish_planCycle(cfg, 1000);
    EXPECT_TRUE(plan.action == CycleAction::WAIT_THEN_PUBLISH);
    EXPECT_EQ_INT(plan.waitMs, 5000);

    cfg.intervalSeconds = 10;
    plan = publish_planCycle(cfg, 1000);
    EXPECT_EQ_INT(plan.waitMs, 10000);

    cfg.intervalSeconds = 86400;
    plan = publish_planCycle(cfg, 1000);
    EXPECT_EQ_INT(plan.waitMs, 86400000u);
}

static void test_plan_polls_when_disabled()
{
    RuntimeConfig cfg = runtime_config_defaults();
    cfg.enabled = false;
    const CyclePlan plan = publish_planCycle(cfg, 250);
    EXPECT_TRUE(plan.action == CycleAction::POLL_DISABLED);
    EXPECT_EQ_INT(plan.waitMs, 250);
}

static void test_plan_after_disabled_is_due_within_one_poll()
{
    RuntimeConfig cfg = runtime_config_defaults();
    cfg.intervalSeconds = 60;

    CyclePlan plan = publish_planCycle(cfg, 1000, true);
    EXPECT_TRUE(plan.action == CycleAction::WAIT_THEN_PUBLISH);
    EXPECT_EQ_INT(plan.waitMs, 1000);

    // Counted from the last poll start: re-enabled 500 ms into a poll, due 500 ms later.
    EXPECT_EQ_INT(publish_remainingMs(plan, 30000, 30500), 500);

    // Once published, the normal interval applies again.
    plan = publish_planCycle(cfg, 1000, false);
    EXPECT_EQ_INT(plan.waitMs, 60000);

    // Never longer than the interval itself.
    cfg.intervalSeconds = 1;
    EXPECT_EQ_INT(publish_planCycle(cfg, 5000, true).waitMs, 1000);

    cfg.enabled = false;
    EXPECT_TRUE(publish_planCycle(cfg, 1000, true).action == CycleAction::POLL_DISABLED);
}

static void test_plan_clamps_hand_built_interval()
{
    RuntimeConfig cfg = runtime_config_defaults();
    cfg.intervalSeconds = 0;
    EXPECT_EQ_INT(publish_planCycle(cfg, 1000).waitMs, 1000);
    cfg.intervalSeconds = 0xFFFFFFFFu;
    EXPECT_EQ_INT(publish_planCycle(cfg, 1000).waitMs, 86400000u);
}

static void test_remaining_counts_from_cycle_start()
{
    const CyclePlan plan{CycleAction::WAIT_THEN_PUBLISH, 10000};
    EXPECT_EQ_INT(publish_remainingMs(plan, 5000, 5000), 10000);
    EXPECT_EQ_INT(publish_remainingMs(plan, 5000, 7000), 8000);
    EXPECT_EQ_INT(publish_remainingMs(plan, 5000, 15000), 0);
    EXPECT_EQ_INT(publish_remainingMs(plan, 5000, 20000), 0);
    // Across the millis() wrap.
    EXPECT_EQ_INT(publish_remainingMs(plan, 0xFFFFF000u, 0x00000100u), 10000 - 0x1100);
}

static void test_finish_publishes_when_connected()
{
    log_capture::reset();
    s_transport = FakeTransport{};
    const RuntimeConfig cfg = runtime_config_defaults();
    TelemetrySample sent{};
    const PublishOutcome out = publish_finishCycle(cfg, ConnectionPhase::CONNECTED, deps(), &sent);

    EXPECT_TRUE(out == PublishOutcome::PUBLISHED);
    EXPECT_EQ_INT(s_transport.calls, 1);
    EXPECT_STREQ(s_transport.topic, "v1/devices/me/telemetry");
    EXPECT_TRUE(s_transport.ctx == &s_transport);
    EXPECT_TRUE(std::strstr(s_transport.payload, "\"temperature\":") != nullptr);
    EXPECT_TRUE(std::strstr(s_transport.payload, "\"humidity\":") != nullptr);
    EXPECT_TRUE(sent.temperature >= 15.0 && sent.temperature < 26.0);
    EXPECT_EQ_INT(log_capture::count(LogLevel::INFO, "Telemetry published topic=v1/devices/me/telemetry"), 1);
}

static void test_disable_during_wait_suppresses_publish()
{
    s_transport = FakeTransport{};
    RuntimeConfig atStart = runtime_config_defaults();
    const CyclePlan plan = publish_planCycle(atStart, 1000);
    EXPECT_TRUE(plan.action == CycleAction::WAIT_THEN_PUBLISH);

    RuntimeConfig afterWait = atStart;
    afterWait.enabled = false;
    EXPECT_TRUE(publish_finishCycle(afterWait, ConnectionPhase::CONNECTED, deps()) == PublishOutcome::SKIPPED_DISABLED);
    EXPECT_EQ_INT(s_transport.calls, 0);
}

static void test_disconnected_cycle_is_skipped_and_logged()
{
    log_capture::reset();
    s_transport = FakeTransport{};
    const RuntimeConfig cfg = runtime_config_defaults();
    const ConnectionPhase phases[] = {ConnectionPhase::DISCONNECTED_NEVER, ConnectionPhase::CONNECTING,
                                      ConnectionPhase::DISCONNECTED_LOST, ConnectionPhase::STOPPED};
    for (ConnectionPhase p : phases)
    {
        EXPECT_TRUE(publish_finishCycle(cfg, p, deps()) == PublishOutcome::SKIPPED_DISCONNECTED);
    }
    EXPECT_EQ_INT(s_transport.calls, 0);
    // Throttled: one warning per window, not one per cycle.
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "Telemetry skipped: not connected"), 1);
}

static void test_transport_failure_is_reported_not_retried()
{
    log_capture::reset();
    s_transport = FakeTransport{};
    s_transport.accept = false;
    const RuntimeConfig cfg = runtime_config_defaults();
    EXPECT_TRUE(publish_finishCycle(cfg, ConnectionPhase::CONNECTED, deps()) == PublishOutcome::PUBLISH_FAILED);
    EXPECT_EQ_INT(s_transport.calls, 1);
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "Telemetry publish failed"), 1);

    const PublishDeps noTransport{midRandom, nullptr, nullptr};
    EXPECT_TRUE(publish_finishCycle(cfg, ConnectionPhase::CONNECTED, noTransport) == PublishOutcome::PUBLISH_FAILED);
}

static void test_outcome_names()
{
    EXPECT_STREQ(publish_outcomeToString(PublishOutcome::PUBLISHED), "published");
    EXPECT_STREQ(publish_outcomeToString(PublishOutcome::SKIPPED_DISCONNECTED), "skipped_disconnected");
}

int main()
{
    test_plan_uses_interval_when_enabled();
    test_plan_polls_when_disabled();
    test_plan_after_disabled_is_due_within_one_poll();
    test_plan_clamps_hand_built_interval();
    test_remaining_counts_from_cycle_start();
    test_finish_publishes_when_connected();
    test_disable_during_wait_suppresses_publish();
    test_disconnected_cycle_is_skipped_and_logged();
    test_transport_failure_is_reported_not_retried();
    test_outcome_names();
    TEST_RESULT("publish_cycle_test");
}
