#include <Arduino.h>
#include <unity.h>

#include <cscsync/orchestrator.hpp>

#include <atomic>

#include "support/later.hpp"

using cscsync::Activity;
using cscsync::Component;
using cscsync::Context;
using cscsync::Error;
using cscsync::Orchestrator;

namespace {

std::atomic<int> started{0};
std::atomic<int> stopped{0};

Error resolveOk(Context&) { return Error::None; }

/// Runs until the shared context completes
Activity waitForShutdown(const char* name, const Component component) {
    return Activity{name, component, [](Context& ctx) {
        ++started;
        ctx.wait(Context::kWaitForever);
        ++stopped;
        return Error::None;
    }};
}

/// Fails after delayMs unless cancelled first
Activity failAfter(const char* name, const Component component, const uint32_t delayMs, const Error error) {
    return Activity{name, component, [delayMs, error](Context& ctx) {
        ++started;
        const Error result = ctx.wait(delayMs) ? Error::None : error;
        ++stopped;
        return result;
    }};
}

void resetCounters() {
    started = 0;
    stopped = 0;
}

}  // namespace

void test_resolve_failure_skips_activities() {
    resetCounters();
    Orchestrator orchestrator([](Context&) { return Error::ScanTimeout; },
                              waitForShutdown("monitor", Component::Ble),
                              waitForShutdown("playback", Component::Video));
    Context root;

    TEST_ASSERT_EQUAL(Error::ScanTimeout, orchestrator.run(root));
    TEST_ASSERT_EQUAL(Component::Ble, orchestrator.failedComponent());
    TEST_ASSERT_EQUAL(Orchestrator::State::Terminated, orchestrator.state());
    TEST_ASSERT_EQUAL_INT(0, started.load());
}

void test_cancel_while_resolving_is_not_a_ble_failure() {
    resetCounters();
    Orchestrator orchestrator([](Context&) { return Error::ContextCancelled; },
                              waitForShutdown("monitor", Component::Ble),
                              waitForShutdown("playback", Component::Video));
    Context root;

    const Error result = orchestrator.run(root);
    TEST_ASSERT_EQUAL(Error::ContextCancelled, result);
    TEST_ASSERT_TRUE(cscsync::isCancellation(result));
    TEST_ASSERT_EQUAL(Component::App, orchestrator.failedComponent());
    TEST_ASSERT_EQUAL(Orchestrator::State::Terminated, orchestrator.state());
    TEST_ASSERT_EQUAL_INT(0, started.load());
}

void test_root_cancel_is_clean_shutdown() {
    resetCounters();
    Orchestrator orchestrator(resolveOk,
                              waitForShutdown("monitor", Component::Ble),
                              waitForShutdown("playback", Component::Video));
    Context root;

    Error result;
    {
        Later interrupt(100, [&] { root.cancel(); });
        result = orchestrator.run(root);
    }

    TEST_ASSERT_EQUAL(Error::None, result);
    TEST_ASSERT_EQUAL(Component::App, orchestrator.failedComponent());
    TEST_ASSERT_EQUAL_INT(2, started.load());
    TEST_ASSERT_EQUAL_INT(2, stopped.load());
}

void test_activity_error_cancels_the_other() {
    resetCounters();
    Orchestrator orchestrator(resolveOk,
                              waitForShutdown("monitor", Component::Ble),
                              failAfter("playback", Component::Video, 50, Error::PlaybackFailed));
    Context root;

    TEST_ASSERT_EQUAL(Error::PlaybackFailed, orchestrator.run(root));
    TEST_ASSERT_EQUAL(Component::Video, orchestrator.failedComponent());
    TEST_ASSERT_EQUAL_INT(2, stopped.load());
    TEST_ASSERT_FALSE(root.isDone());
}

void test_first_error_wins() {
    resetCounters();
    Orchestrator orchestrator(resolveOk,
                              failAfter("monitor", Component::Ble, 50, Error::ConnectionLost),
                              failAfter("playback", Component::Video, 300, Error::PlaybackFailed));
    Context root;

    TEST_ASSERT_EQUAL(Error::ConnectionLost, orchestrator.run(root));
    TEST_ASSERT_EQUAL(Component::Ble, orchestrator.failedComponent());
}

void test_clean_finish_stops_the_rest() {
    resetCounters();
    Orchestrator orchestrator(resolveOk,
                              failAfter("monitor", Component::Ble, 50, Error::None),
                              waitForShutdown("playback", Component::Video));
    Context root;

    TEST_ASSERT_EQUAL(Error::None, orchestrator.run(root));
    TEST_ASSERT_EQUAL_INT(2, stopped.load());
}

void test_cancellation_reason_is_not_a_failure() {
    resetCounters();
    Orchestrator orchestrator(resolveOk,
                              failAfter("monitor", Component::Ble, 50, Error::ContextCancelled),
                              waitForShutdown("playback", Component::Video));
    Context root;

    TEST_ASSERT_EQUAL(Error::None, orchestrator.run(root));
    TEST_ASSERT_EQUAL(Component::App, orchestrator.failedComponent());
}

void test_state_names() {
    TEST_ASSERT_EQUAL_STRING("idle", cscsync::stateName(Orchestrator::State::Idle));
    TEST_ASSERT_EQUAL_STRING("shutting down", cscsync::stateName(Orchestrator::State::ShuttingDown));
    TEST_ASSERT_EQUAL_STRING("VIDEO", cscsync::componentTag(Component::Video));
}

void setup() {
    delay(2000);
    UNITY_BEGIN();
    RUN_TEST(test_resolve_failure_skips_activities);
    RUN_TEST(test_cancel_while_resolving_is_not_a_ble_failure);
    RUN_TEST(test_root_cancel_is_clean_shutdown);
    RUN_TEST(test_activity_error_cancels_the_other);
    RUN_TEST(test_first_error_wins);
    RUN_TEST(test_clean_finish_stops_the_rest);
    RUN_TEST(test_cancellation_reason_is_not_a_failure);
    RUN_TEST(test_state_names);
    UNITY_END();
}

void loop() {}
