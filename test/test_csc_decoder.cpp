#include <Arduino.h>
#include <unity.h>

#include <cscsync/csc.hpp>

#include "support/fake_central.hpp"

using cscsync::csc::CscDecoder;
using cscsync::csc::CscSample;
using cscsync::csc::DecoderState;
using cscsync::csc::SpeedUnits;

namespace {

const CscDecoder kKmh(2105.0f, SpeedUnits::KilometersPerHour);
const CscDecoder kMph(2105.0f, SpeedUnits::MilesPerHour);

cscsync::csc::DecodeResult decode(const CscDecoder& decoder, const std::vector<uint8_t>& payload,
                                  const DecoderState& state) {
    return decoder.decode(payload.data(), payload.size(), state);
}

void assertState(const DecoderState& expected, const DecoderState& actual) {
    TEST_ASSERT_EQUAL_UINT32(expected.previousWheelRevolutions, actual.previousWheelRevolutions);
    TEST_ASSERT_EQUAL_UINT16(expected.previousWheelEventTime, actual.previousWheelEventTime);
}

}  // namespace

void test_empty_payload_is_zero_and_keeps_state() {
    const DecoderState state{10, 1000};
    const auto result = kKmh.decode(nullptr, 0, state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.speed);
    assertState(state, result.state);
}

void test_missing_wheel_flag_is_zero() {
    const DecoderState state{10, 1000};
    std::vector<uint8_t> payload = wheelPayload(11, 2024);
    payload[0] = 0x02;  // crank data only
    const auto result = decode(kKmh, payload, state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.speed);
    assertState(state, result.state);
}

void test_short_payload_is_zero() {
    const DecoderState state{10, 1000};
    std::vector<uint8_t> payload = wheelPayload(11, 2024);
    payload.resize(6);
    const auto result = decode(kKmh, payload, state);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.speed);
    assertState(state, result.state);
}

void test_first_sample_sets_baseline() {
    const auto result = decode(kKmh, wheelPayload(500, 3000), DecoderState{});
    TEST_ASSERT_EQUAL_FLOAT(0.0f, result.speed);
    assertState(DecoderState{500, 3000}, result.state);
}

void test_kmh_conversion() {
    const auto result = decode(kKmh, wheelPayload(101, 2048), DecoderState{100, 1024});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 7.40f, result.speed);
    assertState(DecoderState{101, 2048}, result.state);
}

void test_mph_conversion() {
    const auto result = decode(kMph, wheelPayload(101, 2048), DecoderState{100, 1024});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 4.60f, result.speed);
}

void test_event_time_wraparound() {
    // 65531 -> 5 is 10 ticks, not a negative or huge delta
    const auto result = decode(kKmh, wheelPayload(101, 5), DecoderState{100, 65531});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 2105.0f * 3.6f / 10.0f, result.speed);
    assertState(DecoderState{101, 5}, result.state);
}

void test_revolution_counter_wraparound() {
    const auto result = decode(kKmh, wheelPayload(1, 2048), DecoderState{0xFFFFFFFFu, 1024});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 2.0f * 2105.0f * 3.6f / 1024.0f, result.speed);
}

void test_negative_revolution_delta_flows_through() {
    const auto result = decode(kKmh, wheelPayload(99, 2048), DecoderState{100, 1024});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, -7.40f, result.speed);
}

void test_zero_time_delta_holds_baseline() {
    const DecoderState baseline{100, 1024};
    const auto stalled = decode(kKmh, wheelPayload(101, 1024), baseline);
    TEST_ASSERT_EQUAL_FLOAT(0.0f, stalled.speed);
    assertState(baseline, stalled.state);

    // The held revolution is counted once time advances
    const auto next = decode(kKmh, wheelPayload(102, 2048), stalled.state);
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 2.0f * 2105.0f * 3.6f / 1024.0f, next.speed);
}

void test_crank_data_after_wheel_data_is_ignored() {
    std::vector<uint8_t> payload = wheelPayload(101, 2048);
    payload[0] = 0x03;
    payload.insert(payload.end(), {0x10, 0x00, 0x00, 0x08});
    const auto result = decode(kKmh, payload, DecoderState{100, 1024});
    TEST_ASSERT_FLOAT_WITHIN(0.01f, 7.40f, result.speed);
}

void test_parse_sample_fields() {
    CscSample sample;
    const std::vector<uint8_t> payload = wheelPayload(0x01020304, 0xA0B0);
    TEST_ASSERT_TRUE(CscDecoder::parseSample(payload.data(), payload.size(), sample));
    TEST_ASSERT_EQUAL_HEX8(0x01, sample.flags);
    TEST_ASSERT_EQUAL_HEX32(0x01020304, sample.cumulativeWheelRevolutions);
    TEST_ASSERT_EQUAL_HEX16(0xA0B0, sample.lastWheelEventTime);
}

void test_units_parsing() {
    SpeedUnits units = SpeedUnits::KilometersPerHour;
    TEST_ASSERT_TRUE(cscsync::csc::parseUnits("mph", units));
    TEST_ASSERT_TRUE(units == SpeedUnits::MilesPerHour);
    TEST_ASSERT_FALSE(cscsync::csc::parseUnits("m/s", units));
    TEST_ASSERT_TRUE(units == SpeedUnits::MilesPerHour);
    TEST_ASSERT_EQUAL_STRING("km/h", cscsync::csc::unitsLabel(SpeedUnits::KilometersPerHour));
}

void setup() {
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_empty_payload_is_zero_and_keeps_state);
    RUN_TEST(test_missing_wheel_flag_is_zero);
    RUN_TEST(test_short_payload_is_zero);
    RUN_TEST(test_first_sample_sets_baseline);
    RUN_TEST(test_kmh_conversion);
    RUN_TEST(test_mph_conversion);
    RUN_TEST(test_event_time_wraparound);
    RUN_TEST(test_revolution_counter_wraparound);
    RUN_TEST(test_negative_revolution_delta_flows_through);
    RUN_TEST(test_zero_time_delta_holds_baseline);
    RUN_TEST(test_crank_data_after_wheel_data_is_ignored);
    RUN_TEST(test_parse_sample_fields);
    RUN_TEST(test_units_parsing);
    UNITY_END();
}

void loop() {}
