#include <Arduino.h>
#include <ArduinoJson.h>
#include <unity.h>

#include <cscsync/mpv_link.hpp>
#include <cscsync/playback.hpp>

#include <atomic>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#include "support/later.hpp"

using cscsync::Context;
using cscsync::Error;
using cscsync::MpvLink;
using cscsync::PlaybackController;
using cscsync::PlaybackOptions;

namespace {

class FakeSink {
public:
    const char* failOn = nullptr;

    bool loadFile(const char* path) {
        record("load", path);
        return accept("load");
    }
    bool setSpeed(const float speed) {
        lastSpeed = speed;
        record("speed", nullptr);
        return accept("speed");
    }
    bool setPaused(const bool paused) {
        record(paused ? "pause" : "resume", nullptr);
        return accept(paused ? "pause" : "resume");
    }
    bool showText(const char* text, uint32_t) {
        record("text", text);
        return accept("text");
    }
    bool setWindowScale(float) {
        record("scale", nullptr);
        return accept("scale");
    }

    int count(const char* name) {
        std::lock_guard<std::mutex> lock(mutex_);
        int n = 0;
        for (const auto& call : calls_) {
            if (call == name) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::string> calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::string lastText() {
        std::lock_guard<std::mutex> lock(mutex_);
        return lastText_;
    }

    std::atomic<float> lastSpeed{0.0f};

private:
    void record(const char* name, const char* arg) {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.emplace_back(name);
        if (arg && strcmp(name, "text") == 0) {
            lastText_ = arg;
        }
    }

    bool accept(const char* name) const { return !failOn || strcmp(failOn, name) != 0; }

    std::mutex mutex_;
    std::vector<std::string> calls_;
    std::string lastText_;
};

struct FixedSpeed {
    std::atomic<float> value{0.0f};
    float smoothedSpeed() const { return value.load(); }
};

/// Collects the lines an MpvLink writes
class LineCapture : public Print {
public:
    size_t write(uint8_t c) override {
        buffer_ += static_cast<char>(c);
        return 1;
    }

    size_t write(const uint8_t* data, size_t size) override {
        ++writes;
        buffer_.append(reinterpret_cast<const char*>(data), size);
        return size;
    }

    std::vector<std::string> lines() const {
        std::vector<std::string> out;
        size_t start = 0;
        for (size_t nl = buffer_.find('\n'); nl != std::string::npos; nl = buffer_.find('\n', start)) {
            out.push_back(buffer_.substr(start, nl - start));
            start = nl + 1;
        }
        return out;
    }

    int writes = 0;

private:
    std::string buffer_;
};

class BrokenPrint : public Print {
public:
    size_t write(uint8_t) override { return 0; }
    size_t write(const uint8_t*, size_t) override { return 0; }
};

PlaybackOptions fastOptions() {
    PlaybackOptions options;
    options.filePath = "ride.mp4";
    options.updateIntervalMs = 20;
    options.speedMultiplier = 0.8f;
    options.speedThreshold = 0.25f;
    return options;
}

}  // namespace

void test_startup_loads_file_paused() {
    FakeSink sink;
    FixedSpeed speed;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;
    root.cancel();

    TEST_ASSERT_EQUAL(Error::None, playback.run(root, speed));
    const auto calls = sink.calls();
    TEST_ASSERT_EQUAL_UINT32(3, calls.size());
    TEST_ASSERT_EQUAL_STRING("scale", calls[0].c_str());
    TEST_ASSERT_EQUAL_STRING("load", calls[1].c_str());
    TEST_ASSERT_EQUAL_STRING("pause", calls[2].c_str());
}

void test_below_threshold_stays_paused_without_repeats() {
    FakeSink sink;
    FixedSpeed speed;
    speed.value = 0.1f;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;

    Error result;
    {
        Later stop(200, [&] { root.cancel(); });
        result = playback.run(root, speed);
    }

    TEST_ASSERT_EQUAL(Error::None, result);
    TEST_ASSERT_EQUAL_INT(1, sink.count("pause"));
    TEST_ASSERT_EQUAL_INT(0, sink.count("speed"));
    TEST_ASSERT_EQUAL_INT(0, sink.count("resume"));
}

void test_speed_resumes_then_pauses_on_stop() {
    FakeSink sink;
    FixedSpeed speed;
    speed.value = 10.0f;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;

    Error result;
    {
        Later rider(200, [&] {
            speed.value = 0.0f;
            delay(200);
            root.cancel();
        });
        result = playback.run(root, speed);
    }

    TEST_ASSERT_EQUAL(Error::None, result);
    TEST_ASSERT_FLOAT_WITHIN(0.001f, 8.0f, sink.lastSpeed.load());
    TEST_ASSERT_TRUE(sink.count("speed") >= 2);
    TEST_ASSERT_EQUAL_INT(1, sink.count("resume"));
    // startup pause plus one on the drop below threshold
    TEST_ASSERT_EQUAL_INT(2, sink.count("pause"));
}

void test_shutdown_pauses_running_video() {
    FakeSink sink;
    FixedSpeed speed;
    speed.value = 10.0f;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;

    Error result;
    {
        Later stop(200, [&] { root.cancel(); });
        result = playback.run(root, speed);
    }
    TEST_ASSERT_EQUAL(Error::None, result);

    const auto calls = sink.calls();
    TEST_ASSERT_EQUAL_STRING("pause", calls.back().c_str());
}

void test_display_speed_shows_text() {
    FakeSink sink;
    FixedSpeed speed;
    speed.value = 12.5f;
    PlaybackOptions options = fastOptions();
    options.displaySpeed = true;
    options.units = cscsync::csc::SpeedUnits::MilesPerHour;
    PlaybackController<FakeSink> playback(sink, options);
    Context root;

    Error result;
    {
        Later stop(100, [&] { root.cancel(); });
        result = playback.run(root, speed);
    }
    TEST_ASSERT_EQUAL(Error::None, result);

    TEST_ASSERT_TRUE(sink.count("text") >= 1);
    TEST_ASSERT_EQUAL_STRING("Speed: 12.50 mph", sink.lastText().c_str());
}

void test_rejected_command_fails_playback() {
    FakeSink sink;
    sink.failOn = "speed";
    FixedSpeed speed;
    speed.value = 10.0f;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;

    TEST_ASSERT_EQUAL(Error::PlaybackFailed, playback.run(root, speed));
}

void test_rejected_load_fails_playback() {
    FakeSink sink;
    sink.failOn = "load";
    FixedSpeed speed;
    PlaybackController<FakeSink> playback(sink, fastOptions());
    Context root;

    TEST_ASSERT_EQUAL(Error::PlaybackFailed, playback.run(root, speed));
    TEST_ASSERT_EQUAL_INT(0, sink.count("pause"));
}

void test_mpv_commands_are_json_lines() {
    LineCapture capture;
    MpvLink mpv(capture);

    TEST_ASSERT_TRUE(mpv.loadFile("ride.mp4"));
    TEST_ASSERT_TRUE(mpv.setPaused(true));
    TEST_ASSERT_TRUE(mpv.showText("Speed: 1.00 km/h", 1000));

    const auto lines = capture.lines();
    TEST_ASSERT_EQUAL_UINT32(3, lines.size());
    TEST_ASSERT_EQUAL_INT(3, capture.writes);
    TEST_ASSERT_EQUAL_STRING("{\"command\":[\"loadfile\",\"ride.mp4\",\"replace\"],\"request_id\":1}",
                             lines[0].c_str());
    TEST_ASSERT_EQUAL_STRING("{\"command\":[\"set_property\",\"pause\",true],\"request_id\":2}",
                             lines[1].c_str());
    TEST_ASSERT_EQUAL_STRING("{\"command\":[\"show-text\",\"Speed: 1.00 km/h\",1000],\"request_id\":3}",
                             lines[2].c_str());
    TEST_ASSERT_EQUAL_UINT32(3, mpv.lastRequestId());
}

void test_mpv_speed_is_clamped() {
    LineCapture capture;
    MpvLink mpv(capture);

    TEST_ASSERT_TRUE(mpv.setSpeed(-3.0f));
    TEST_ASSERT_TRUE(mpv.setSpeed(500.0f));
    TEST_ASSERT_TRUE(mpv.setSpeed(1.5f));

    const auto lines = capture.lines();
    TEST_ASSERT_EQUAL_UINT32(3, lines.size());

    const float expected[] = {MpvLink::kMinSpeed, MpvLink::kMaxSpeed, 1.5f};
    for (size_t i = 0; i < 3; ++i) {
        JsonDocument doc;
        TEST_ASSERT_TRUE(deserializeJson(doc, lines[i]) == DeserializationError::Ok);
        TEST_ASSERT_EQUAL_STRING("speed", doc["command"][1].as<const char*>());
        TEST_ASSERT_FLOAT_WITHIN(0.0001f, expected[i], doc["command"][2].as<float>());
    }
}

void test_mpv_write_failure_and_missing_file() {
    BrokenPrint broken;
    MpvLink mpv(broken);
    TEST_ASSERT_FALSE(mpv.setPaused(false));

    LineCapture capture;
    MpvLink ok(capture);
    TEST_ASSERT_FALSE(ok.loadFile(""));
    TEST_ASSERT_FALSE(ok.loadFile(nullptr));
    TEST_ASSERT_EQUAL_UINT32(0, capture.lines().size());
}

void setup() {
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_startup_loads_file_paused);
    RUN_TEST(test_below_threshold_stays_paused_without_repeats);
    RUN_TEST(test_speed_resumes_then_pauses_on_stop);
    RUN_TEST(test_shutdown_pauses_running_video);
    RUN_TEST(test_display_speed_shows_text);
    RUN_TEST(test_rejected_command_fails_playback);
    RUN_TEST(test_rejected_load_fails_playback);
    RUN_TEST(test_mpv_commands_are_json_lines);
    RUN_TEST(test_mpv_speed_is_clamped);
    RUN_TEST(test_mpv_write_failure_and_missing_file);
    UNITY_END();
}

void loop() {}
