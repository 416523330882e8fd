#include "test_macros.h"

#include "attributes.h"
#include "log_capture.h"

TEST_MAIN_STATE;

static AttributeParseResult parse(const char *json, AttributePatch *patch)
{
    return attributes_parse(reinterpret_cast<const uint8_t *>(json), std::strlen(json), patch);
}

// parse + apply against cfg; returns number of changed fields.
static uint8_t update(RuntimeConfig &cfg, const char *json, AttributeChanges *changes = nullptr)
{
    AttributePatch patch{};
    parse(json, &patch);
    return attributes_apply(cfg, patch, changes);
}

static void test_partial_update_touches_only_present_keys()
{
    RuntimeConfig cfg = runtime_config_defaults();
    EXPECT_EQ_INT(update(cfg, "{\"interval\":10}"), 1);
    EXPECT_EQ_INT(cfg.intervalSeconds, 10);
    EXPECT_TRUE(cfg.enabled);
    EXPECT_STREQ(cfg.firmwareVersion, "1.0");

    EXPECT_EQ_INT(update(cfg, "{\"enabled\":false}"), 1);
    EXPECT_EQ_INT(cfg.intervalSeconds, 10);
    EXPECT_FALSE(cfg.enabled);

    EXPECT_EQ_INT(update(cfg, "{\"firmware_version\":\"2.1\"}"), 1);
    EXPECT_STREQ(cfg.firmwareVersion, "2.1");
    EXPECT_EQ_INT(cfg.intervalSeconds, 10);
    EXPECT_FALSE(cfg.enabled);
}

static void test_invalid_interval_keeps_previous_value()
{
    log_capture::reset();
    RuntimeConfig cfg = runtime_config_defaults();
    const char *bad[] = {"{\"interval\":0}", "{\"interval\":-3}", "{\"interval\":\"abc\"}",
                         "{\"interval\":null}", "{\"interval\":true}", "{\"interval\":[5]}",
                         "{\"interval\":86401}", "{\"interval\":0.5}"};
    for (const char *json : bad)
    {
        AttributePatch patch{};
        EXPECT_TRUE(parse(json, &patch) == AttributeParseResult::OK);
        EXPECT_TRUE(patch.interval == FieldVerdict::REJECTED);
        EXPECT_EQ_INT(attributes_apply(cfg, patch, nullptr), 0);
        EXPECT_EQ_INT(cfg.intervalSeconds, 5);
    }
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "Config field rejected key=interval"), 8);
}

static void test_interval_coercions()
{
    RuntimeConfig cfg = runtime_config_defaults();
    update(cfg, "{\"interval\":12.9}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 12);
    update(cfg, "{\"interval\":\" 30 \"}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 30);
    update(cfg, "{\"interval\":86400}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 86400);
    update(cfg, "{\"interval\":1}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 1);
}

static void test_enabled_coercions()
{
    RuntimeConfig cfg = runtime_config_defaults();
    const char *offs[] = {"{\"enabled\":false}", "{\"enabled\":0}", "{\"enabled\":\"OFF\"}",
                          "{\"enabled\":\"no\"}", "{\"enabled\":\"False\"}", "{\"enabled\":\"0\"}"};
    for (const char *json : offs)
    {
        cfg.enabled = true;
        update(cfg, json);
        EXPECT_FALSE(cfg.enabled);
    }
    const char *ons[] = {"{\"enabled\":true}", "{\"enabled\":1}", "{\"enabled\":\"on\"}",
                         "{\"enabled\":\"YES\"}", "{\"enabled\":\"true\"}", "{\"enabled\":\"1\"}"};
    for (const char *json : ons)
    {
        cfg.enabled = false;
        update(cfg, json);
        EXPECT_TRUE(cfg.enabled);
    }

    const char *bad[] = {"{\"enabled\":2}", "{\"enabled\":\"maybe\"}", "{\"enabled\":null}", "{\"enabled\":{}}"};
    for (const char *json : bad)
    {
        cfg.enabled = true;
        AttributePatch patch{};
        parse(json, &patch);
        EXPECT_TRUE(patch.enabled == FieldVerdict::REJECTED);
        attributes_apply(cfg, patch, nullptr);
        EXPECT_TRUE(cfg.enabled);
    }
}

static void test_firmware_version_coercions()
{
    RuntimeConfig cfg = runtime_config_defaults();
    update(cfg, "{\"firmware_version\":2}");
    EXPECT_STREQ(cfg.firmwareVersion, "2");
    update(cfg, "{\"firmware_version\":\"\"}");
    EXPECT_STREQ(cfg.firmwareVersion, "");

    update(cfg, "{\"firmware_version\":\"v3\"}");
    AttributePatch patch{};
    parse("{\"firmware_version\":null}", &patch);
    EXPECT_TRUE(patch.firmwareVersion == FieldVerdict::REJECTED);
    attributes_apply(cfg, patch, nullptr);
    EXPECT_STREQ(cfg.firmwareVersion, "v3");
}

static void test_long_firmware_version_is_truncated()
{
    log_capture::reset();
    RuntimeConfig cfg = runtime_config_defaults();
    AttributeChanges changes{};
    update(cfg, "{\"firmware_version\":\"0123456789012345678901234567890123456789\"}", &changes);
    EXPECT_EQ_INT(std::strlen(cfg.firmwareVersion), FIRMWARE_VERSION_MAX - 1);
    EXPECT_STREQ(cfg.firmwareVersion, "0123456789012345678901234567890");
    EXPECT_TRUE(changes.firmwareTruncated);

    attributes_logChanges(changes, AttributeSource::PUSH_UPDATE);
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "truncated"), 1);
}

static void test_rejected_field_does_not_block_others()
{
    RuntimeConfig cfg = runtime_config_defaults();
    AttributeChanges changes{};
    const uint8_t changed = update(cfg, "{\"interval\":-1,\"enabled\":false,\"firmware_version\":\"9\"}", &changes);
    EXPECT_EQ_INT(changed, 2);
    EXPECT_EQ_INT(cfg.intervalSeconds, 5);
    EXPECT_FALSE(cfg.enabled);
    EXPECT_STREQ(cfg.firmwareVersion, "9");
    EXPECT_EQ_INT(changes.recognizedKeys, 3);
    EXPECT_EQ_INT(changes.rejectedKeys, 1);
}

static void test_snapshot_and_push_shapes_write_the_same()
{
    RuntimeConfig pushed = runtime_config_defaults();
    RuntimeConfig snap = runtime_config_defaults();
    update(pushed, "{\"interval\":15,\"enabled\":false,\"firmware_version\":\"1.2\"}");
    update(snap, "{\"shared\":{\"interval\":15,\"enabled\":false,\"firmware_version\":\"1.2\"}}");

    EXPECT_EQ_INT(pushed.intervalSeconds, snap.intervalSeconds);
    EXPECT_EQ_INT(pushed.enabled, snap.enabled);
    EXPECT_STREQ(pushed.firmwareVersion, snap.firmwareVersion);
}

static void test_shared_wins_over_client()
{
    RuntimeConfig cfg = runtime_config_defaults();
    update(cfg, "{\"client\":{\"interval\":7,\"firmware_version\":\"c\"},\"shared\":{\"interval\":9}}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 9);
    EXPECT_STREQ(cfg.firmwareVersion, "c");

    // An invalid shared value does not discard a valid client one.
    cfg = runtime_config_defaults();
    update(cfg, "{\"client\":{\"interval\":7},\"shared\":{\"interval\":\"x\"}}");
    EXPECT_EQ_INT(cfg.intervalSeconds, 7);
}

static void test_malformed_payloads_are_no_ops()
{
    log_capture::reset();
    RuntimeConfig cfg = runtime_config_defaults();
    AttributePatch patch{};

    EXPECT_TRUE(parse("{not json", &patch) == AttributeParseResult::INVALID_JSON);
    EXPECT_EQ_INT(attributes_apply(cfg, patch, nullptr), 0);
    EXPECT_TRUE(parse("[1,2,3]", &patch) == AttributeParseResult::NOT_OBJECT);
    EXPECT_EQ_INT(attributes_apply(cfg, patch, nullptr), 0);
    EXPECT_TRUE(attributes_parse(nullptr, 0, &patch) == AttributeParseResult::EMPTY);

    EXPECT_EQ_INT(cfg.intervalSeconds, 5);
    EXPECT_TRUE(cfg.enabled);
    EXPECT_STREQ(cfg.firmwareVersion, "1.0");
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, "Attribute payload"), 3);
}

static void test_unknown_keys_are_silent()
{
    log_capture::reset();
    RuntimeConfig cfg = runtime_config_defaults();
    AttributeChanges changes{};
    EXPECT_EQ_INT(update(cfg, "{\"color\":\"red\",\"deleted\":[\"interval\"]}", &changes), 0);
    EXPECT_EQ_INT(changes.recognizedKeys, 0);
    EXPECT_EQ_INT(log_capture::count(LogLevel::WARN, ""), 0);

    attributes_logChanges(changes, AttributeSource::PUSH_UPDATE);
    EXPECT_EQ_INT(log_capture::count(LogLevel::DEBUG, "no recognized keys"), 1);
}

static void test_changes_are_logged_with_old_and_new()
{
    log_capture::reset();
    RuntimeConfig cfg = runtime_config_defaults();
    AttributeChanges changes{};
    update(cfg, "{\"interval\":10,\"enabled\":true,\"firmware_version\":\"2.0\"}", &changes);
    attributes_logChanges(changes, AttributeSource::SNAPSHOT_RESPONSE);

    EXPECT_EQ_INT(log_capture::count(LogLevel::INFO, "key=interval old=5s new=10s source=snapshot_response"), 1);
    EXPECT_EQ_INT(log_capture::count(LogLevel::DEBUG, "Config unchanged key=enabled"), 1);
    EXPECT_EQ_INT(log_capture::count(LogLevel::INFO, "key=firmware_version old=1.0 new=2.0"), 1);
    EXPECT_EQ_INT(log_capture::count(LogLevel::INFO, "OTA simulation start target=2.0"), 1);
    EXPECT_EQ_INT(log_capture::count(LogLevel::INFO, "OTA simulation complete version=2.0"), 1);
}

int main()
{
    test_partial_update_touches_only_present_keys();
    test_invalid_interval_keeps_previous_value();
    test_interval_coercions();
    test_enabled_coercions();
    test_firmware_version_coercions();
    test_long_firmware_version_is_truncated();
    test_rejected_field_does_not_block_others();
    test_snapshot_and_push_shapes_write_the_same();
    test_shared_wins_over_client();
    test_malformed_payloads_are_no_ops();
    test_unknown_keys_are_silent();
    test_changes_are_logged_with_old_and_new();
    TEST_RESULT("attributes_test");
}
