#include <Arduino.h>
#include <ArduinoJson.h>
#include <Preferences.h>
#include <unity.h>

#include <cscsync/log.h>
#include <cscsync/settings.h>

using cscsync::SyncConfig;
using cscsync::SyncSettings;
using cscsync::csc::SpeedUnits;

namespace {

// Runtime settings back to factory defaults, without touching NVS
void restoreDefaults() {
    auto builder = SyncSettings::modify();
    TEST_ASSERT_TRUE(builder.reset(true).commit(false));
}

}  // namespace

void setUp() {
    restoreDefaults();
}

void tearDown() {}

void test_factory_defaults() {
    const SyncConfig& d = cscsync::factory_defaults();
    TEST_ASSERT_EQUAL_STRING("f1:42:d8:66:fb:fe", d.sensor_address);
    TEST_ASSERT_EQUAL_UINT32(30, d.scan_timeout_secs);
    TEST_ASSERT_EQUAL_FLOAT(2155.0f, d.wheel_circumference_mm);
    TEST_ASSERT_TRUE(d.speed_units == SpeedUnits::KilometersPerHour);
    TEST_ASSERT_EQUAL_UINT32(5, d.smoothing_window);
    TEST_ASSERT_EQUAL_FLOAT(0.25f, d.speed_threshold);
    TEST_ASSERT_EQUAL_STRING("cycling_test.mp4", d.video_file_path);
    TEST_ASSERT_EQUAL_UINT32(1000, d.update_interval_ms);
    TEST_ASSERT_EQUAL_FLOAT(0.8f, d.speed_multiplier);
    TEST_ASSERT_TRUE(d.display_speed);
    TEST_ASSERT_EQUAL_FLOAT(1.0f, d.window_scale);
    TEST_ASSERT_EQUAL_UINT8(CSCSYNC_LOG_LEVEL_INFO, d.log_level);
    TEST_ASSERT_TRUE(cscsync::validate_config(d, nullptr));
}

void test_partial_merge_keeps_other_fields() {
    auto builder = SyncSettings::modify();
    builder.merge_json(R"({"speed":{"speed_units":"mph","smoothing_window":8},"video":{"display_speed":false}})");
    TEST_ASSERT_TRUE(builder.is_modified());
    TEST_ASSERT_TRUE(builder.commit(false));
    TEST_ASSERT_FALSE(builder.is_modified());

    const SyncConfig config = SyncSettings::get().snapshot();
    TEST_ASSERT_TRUE(config.speed_units == SpeedUnits::MilesPerHour);
    TEST_ASSERT_EQUAL_UINT32(8, config.smoothing_window);
    TEST_ASSERT_FALSE(config.display_speed);
    TEST_ASSERT_EQUAL_FLOAT(2155.0f, config.wheel_circumference_mm);
    TEST_ASSERT_EQUAL_STRING("f1:42:d8:66:fb:fe", config.sensor_address);
}

void test_merge_every_section() {
    auto builder = SyncSettings::modify();
    builder.merge_json(R"({
        "app": {"log_level": "debug"},
        "ble": {"sensor_address": "AA:BB:CC:DD:EE:FF", "scan_timeout_secs": 45},
        "speed": {"wheel_circumference_mm": 2100, "speed_threshold": 1.5},
        "video": {"file_path": "alps.mkv", "update_interval_ms": 500,
                  "speed_multiplier": 1.2, "window_scale_factor": 0.5}
    })");
    TEST_ASSERT_NULL(builder.get_last_error());
    TEST_ASSERT_TRUE(builder.commit(false));

    const SyncConfig config = SyncSettings::get().snapshot();
    TEST_ASSERT_EQUAL_UINT8(CSCSYNC_LOG_LEVEL_DEBUG, config.log_level);
    TEST_ASSERT_EQUAL_STRING("AA:BB:CC:DD:EE:FF", config.sensor_address);
    TEST_ASSERT_EQUAL_UINT32(45, config.scan_timeout_secs);
    TEST_ASSERT_EQUAL_FLOAT(2100.0f, config.wheel_circumference_mm);
    TEST_ASSERT_EQUAL_FLOAT(1.5f, config.speed_threshold);
    TEST_ASSERT_EQUAL_STRING("alps.mkv", config.video_file_path);
    TEST_ASSERT_EQUAL_UINT32(500, config.update_interval_ms);
    TEST_ASSERT_FLOAT_WITHIN(0.0001f, 1.2f, config.speed_multiplier);
    TEST_ASSERT_EQUAL_FLOAT(0.5f, config.window_scale);
}

void test_unknown_units_rejected() {
    auto builder = SyncSettings::modify();
    builder.merge_json(R"({"speed":{"speed_units":"knots"}})");
    TEST_ASSERT_FALSE(builder.commit(false));
    TEST_ASSERT_EQUAL_STRING("Invalid speed.speed_units: must be km/h or mph", builder.get_last_error());
    TEST_ASSERT_TRUE(SyncSettings::get().snapshot().speed_units == SpeedUnits::KilometersPerHour);
}

void test_wrong_type_rejected() {
    auto builder = SyncSettings::modify();
    builder.merge_json(R"({"ble":{"scan_timeout_secs":"soon"}})");
    TEST_ASSERT_EQUAL_STRING("Invalid ble.scan_timeout_secs: wrong type", builder.get_last_error());
    TEST_ASSERT_FALSE(builder.validate());
}

void test_malformed_json_rejected() {
    auto builder = SyncSettings::modify();
    builder.merge_json("{\"ble\":");
    TEST_ASSERT_EQUAL_STRING("JSON parse error", builder.get_last_error());
    TEST_ASSERT_FALSE(builder.commit(false));
}

void test_range_checks() {
    {
        auto builder = SyncSettings::modify();
        builder.set_sensor_address("f1-42-d8-66-fb-fe");
        TEST_ASSERT_FALSE(builder.validate());
        TEST_ASSERT_EQUAL_STRING("Invalid ble.sensor_address: expected xx:xx:xx:xx:xx:xx",
                                 builder.get_last_error());
    }
    {
        auto builder = SyncSettings::modify();
        builder.set_wheel_circumference_mm(0.0f);
        TEST_ASSERT_FALSE(builder.validate());
        TEST_ASSERT_EQUAL_STRING("Invalid speed.wheel_circumference_mm: must be > 0", builder.get_last_error());
    }
    {
        auto builder = SyncSettings::modify();
        builder.set_smoothing_window(65);
        TEST_ASSERT_FALSE(builder.validate());
    }
    {
        auto builder = SyncSettings::modify();
        builder.set_update_interval_ms(10);
        TEST_ASSERT_FALSE(builder.commit(false));
        TEST_ASSERT_EQUAL_STRING("Invalid video.update_interval_ms: must be 100..60000", builder.get_last_error());
    }
    {
        auto builder = SyncSettings::modify();
        builder.set_video_file_path("");
        TEST_ASSERT_FALSE(builder.validate());
    }
    TEST_ASSERT_EQUAL_UINT32(1000, SyncSettings::get().snapshot().update_interval_ms);
}

void test_unknown_log_level_rejected() {
    auto builder = SyncSettings::modify();
    builder.merge_json(R"({"app":{"log_level":"verbose"}})");
    TEST_ASSERT_EQUAL_STRING("Invalid app.log_level", builder.get_last_error());
}

void test_to_json_round_trips_through_merge() {
    {
        auto builder = SyncSettings::modify();
        TEST_ASSERT_TRUE(builder.set_video_file_path("loop.mp4").set_speed_multiplier(2.0f).commit(false));
    }

    char buffer[512];
    const size_t written = SyncSettings::get().to_json(buffer, sizeof(buffer));
    TEST_ASSERT_TRUE(written > 0);

    JsonDocument doc;
    TEST_ASSERT_TRUE(deserializeJson(doc, buffer) == DeserializationError::Ok);
    TEST_ASSERT_EQUAL_STRING("info", doc["app"]["log_level"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("km/h", doc["speed"]["speed_units"].as<const char*>());
    TEST_ASSERT_EQUAL_STRING("loop.mp4", doc["video"]["file_path"].as<const char*>());
    TEST_ASSERT_EQUAL_UINT32(SyncSettings::SCHEMA_VERSION, doc["metadata"]["version"].as<uint32_t>());

    restoreDefaults();
    auto builder = SyncSettings::modify();
    TEST_ASSERT_TRUE(builder.merge_json(buffer).commit(false));
    TEST_ASSERT_EQUAL_STRING("loop.mp4", SyncSettings::get().snapshot().video_file_path);
    TEST_ASSERT_EQUAL_FLOAT(2.0f, SyncSettings::get().snapshot().speed_multiplier);
}

void test_line_without_settings_does_not_write_nvs() {
    {
        Preferences prefs;
        TEST_ASSERT_TRUE(prefs.begin("csc_sync", false));
        prefs.remove("sync_cfg");
        prefs.end();
    }

    auto builder = SyncSettings::modify();
    builder.merge_json(R"({"request_id":1,"error":"success"})");
    TEST_ASSERT_NULL(builder.get_last_error());
    TEST_ASSERT_FALSE(builder.is_modified());
    TEST_ASSERT_TRUE(builder.commit());

    Preferences prefs;
    TEST_ASSERT_TRUE(prefs.begin("csc_sync", true));
    const bool stored = prefs.isKey("sync_cfg");
    prefs.end();
    TEST_ASSERT_FALSE(stored);
}

void test_to_json_small_buffer() {
    char buffer[16];
    TEST_ASSERT_EQUAL_UINT32(0, SyncSettings::get().to_json(buffer, sizeof(buffer)));
    TEST_ASSERT_EQUAL_UINT32(0, SyncSettings::get().to_json(nullptr, 64));
}

void setup() {
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_factory_defaults);
    RUN_TEST(test_partial_merge_keeps_other_fields);
    RUN_TEST(test_merge_every_section);
    RUN_TEST(test_unknown_units_rejected);
    RUN_TEST(test_wrong_type_rejected);
    RUN_TEST(test_malformed_json_rejected);
    RUN_TEST(test_range_checks);
    RUN_TEST(test_unknown_log_level_rejected);
    RUN_TEST(test_to_json_round_trips_through_merge);
    RUN_TEST(test_to_json_small_buffer);
    RUN_TEST(test_line_without_settings_does_not_write_nvs);
    UNITY_END();
}

void loop() {}
