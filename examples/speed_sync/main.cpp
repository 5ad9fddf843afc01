/*
 * ESP32 BLE Sync Cycle
 *
 * Pairs with a Bluetooth LE Cycling Speed and Cadence sensor and keeps an mpv
 * video player running at a rate that matches the rider's speed.
 *
 * Features:
 * - Scans for the configured sensor address, then resolves CSC 0x1816 / 0x2A5B
 * - Decodes wheel revolution notifications into km/h or mph
 * - Sliding-window speed smoothing
 * - mpv JSON IPC commands on MPV_SERIAL (one JSON object per line)
 * - Ctrl-C / Ctrl-D on the console or the BOOT button stops the run
 * - JSON lines on the console update the NVS settings (applied on next boot)
 *
 * Thread Safety:
 * - NimBLE callbacks only hand data off (queue, event group)
 * - The monitor and playback tasks share the speed controller through its lock
 */

#include <Arduino.h>
#include <NimBLEDevice.h>
#include <cscsync.hpp>

// mpv gets its own UART; its replies must not reach the settings console
#ifndef MPV_SERIAL
#define MPV_SERIAL Serial1
#endif

#ifndef MPV_BAUD
#define MPV_BAUD 115200
#endif

#ifndef SHUTDOWN_BUTTON_PIN
#define SHUTDOWN_BUTTON_PIN 0  // BOOT button
#endif

inline constexpr char deviceName[] = "CscSync";

using Central = cscsync_nimble::NimbleCentral;
using Speed = cscsync::SpeedController<>;

static void onSettingsLine(const char* line) {
    auto builder = cscsync::SyncSettings::modify();
    builder.merge_json(line);
    if (builder.get_last_error() == nullptr && !builder.is_modified()) {
        CSCSYNC_LOG_DEBUG("[CFG] Ignoring console line without settings\n");
        return;
    }
    if (builder.commit()) {
        CSCSYNC_LOG_INFO("[CFG] Settings saved, restart to apply\n");
    } else {
        CSCSYNC_LOG_ERROR("[CFG] Settings rejected: %s\n", builder.get_last_error());
    }
}

static cscsync::Error runSession(const cscsync::SyncConfig& config) {
    using cscsync::Component;
    using cscsync::Context;

    Context root;

    cscsync::SignalOptions signalOptions;
    signalOptions.buttonPin = SHUTDOWN_BUTTON_PIN;
    cscsync::ShutdownSignals signals(signalOptions);
    signals.setLineHandler(onSettingsLine);
    if (!signals.start(root)) {
        CSCSYNC_LOG_WARN("[APP] Running without shutdown signals\n");
    }

    Central central;
    Speed speed(config.smoothing_window);
    const cscsync::csc::CscDecoder decoder(config.wheel_circumference_mm, config.speed_units);

    cscsync::PeripheralResolver<Central> resolver(central);
    cscsync::NotificationMonitor<Central, Speed> monitor(central);

    cscsync::MpvLink mpv(MPV_SERIAL);
    cscsync::PlaybackOptions playbackOptions;
    playbackOptions.filePath = config.video_file_path;
    playbackOptions.updateIntervalMs = config.update_interval_ms;
    playbackOptions.speedMultiplier = config.speed_multiplier;
    playbackOptions.speedThreshold = config.speed_threshold;
    playbackOptions.displaySpeed = config.display_speed;
    playbackOptions.windowScale = config.window_scale;
    playbackOptions.units = config.speed_units;
    cscsync::PlaybackController<cscsync::MpvLink> playback(mpv, playbackOptions);

    cscsync::ResolverOptions resolverOptions;
    resolverOptions.sensorAddress = config.sensor_address;
    resolverOptions.scanTimeoutSeconds = config.scan_timeout_secs;
    Central::Characteristic* characteristic = nullptr;

    cscsync::Orchestrator orchestrator(
        [&](Context& ctx) {
            return resolver.resolve(ctx, resolverOptions, characteristic);
        },
        cscsync::Activity{"monitor", Component::Ble, [&](Context& ctx) {
            return monitor.run(ctx, *characteristic, decoder, speed);
        }},
        cscsync::Activity{"playback", Component::Video, [&](Context& ctx) {
            return playback.run(ctx, speed);
        }});

    const cscsync::Error error = orchestrator.run(root);

    signals.stop();
    central.disconnect();
    return error;
}

void setup() {
    Serial.begin(115200);
    MPV_SERIAL.begin(MPV_BAUD);
    delay(1000);

    const cscsync::SyncConfig config = cscsync::SyncSettings::get().snapshot();
    cscsync::log::setLevel(config.log_level);
    CSCSYNC_LOG_INFO("[APP] Starting BLE Sync Cycle (log level %s)\n", cscsync::log::levelName(config.log_level));

    if (!Central::init(deviceName)) {
        CSCSYNC_LOG_ERROR("[APP] FATAL: failed to initialize BLE\n");
        while (1) delay(1000);
    }

    const cscsync::Error error = runSession(config);
    if (error != cscsync::Error::None && !cscsync::isCancellation(error)) {
        CSCSYNC_LOG_ERROR("[APP] FATAL: %s, waiting for reset\n", cscsync::toString(error));
        while (1) delay(1000);
    }

    CSCSYNC_LOG_INFO("[APP] Application shutdown complete... goodbye!\n");
}

void loop() {
    delay(1000);
}
