/*
 * Sync Settings - operator configuration and persistent storage
 *
 * Holds the configuration of one sync run (sensor, speed, video, logging)
 * and persists it in NVS. Changes arrive as partial JSON documents on the
 * console and take effect on the next boot.
 *
 * Memory: Static allocation only, no heap usage outside JSON parsing
 * Storage: ESP32 NVS
 */

#ifndef CSCSYNC_SETTINGS_H
#define CSCSYNC_SETTINGS_H

#include "csc.hpp"

#include <stddef.h>
#include <stdint.h>

namespace cscsync {

// Flat layout, stored as one NVS blob
struct SyncConfig {
    // ble
    char sensor_address[18];       // "aa:bb:cc:dd:ee:ff"
    uint32_t scan_timeout_secs;
    // speed
    float wheel_circumference_mm;
    csc::SpeedUnits speed_units;
    uint32_t smoothing_window;
    float speed_threshold;
    // video
    char video_file_path[96];
    uint32_t update_interval_ms;
    float speed_multiplier;
    bool display_speed;
    float window_scale;
    // app
    uint8_t log_level;
};

/** @return Configuration used when NVS holds nothing valid */
const SyncConfig& factory_defaults();

/**
 * Check every field against its allowed range
 * @param error Receives a static message on failure (may be nullptr)
 */
[[nodiscard]] bool validate_config(const SyncConfig& config, const char** error);

class SyncSettingsBuilder;

/**
 * Sync Settings (NVS-backed persistent configuration)
 *
 * Access: SyncSettings::get().snapshot()
 * Modify: SyncSettings::modify().merge_json(json).commit()
 */
struct SyncSettings {
    static constexpr uint32_t SCHEMA_VERSION = 1;  // JSON schema version

    /** @return Consistent copy of the runtime settings */
    [[nodiscard]] SyncConfig snapshot() const;

    /** @return Current runtime settings (loaded from NVS on first use) */
    static const SyncSettings& get();

    /** @return Builder for modifying settings (call commit() to persist) */
    static SyncSettingsBuilder modify();

    /**
     * Serialize current settings to JSON
     * @return Number of bytes written (0 on error)
     */
    [[nodiscard]] size_t to_json(char* buffer, size_t buffer_size) const;

private:
    // NOLINTBEGIN
    SyncSettings() = default;
    ~SyncSettings() = default;
    SyncSettings(const SyncSettings&) = delete;
    SyncSettings(SyncSettings&&) = delete;
    SyncSettings& operator=(const SyncSettings&) = delete;
    SyncSettings& operator=(SyncSettings&&) = delete;
    // NOLINTEND
};

/**
 * Builder for partial settings updates
 *
 * Transactional: changes applied atomically on commit() (validate -> NVS -> runtime).
 * Only fields touched through this builder overwrite the runtime settings.
 */
class SyncSettingsBuilder {
public:
    // ---- BLE ----
    SyncSettingsBuilder& set_sensor_address(const char* address);
    SyncSettingsBuilder& set_scan_timeout_secs(uint32_t seconds);

    // ---- Speed ----
    SyncSettingsBuilder& set_wheel_circumference_mm(float mm);
    SyncSettingsBuilder& set_speed_units(csc::SpeedUnits units);
    SyncSettingsBuilder& set_smoothing_window(uint32_t samples);
    SyncSettingsBuilder& set_speed_threshold(float threshold);

    // ---- Video ----
    SyncSettingsBuilder& set_video_file_path(const char* path);
    SyncSettingsBuilder& set_update_interval_ms(uint32_t ms);
    SyncSettingsBuilder& set_speed_multiplier(float multiplier);
    SyncSettingsBuilder& set_display_speed(bool display);
    SyncSettingsBuilder& set_window_scale(float scale);

    // ---- App ----
    SyncSettingsBuilder& set_log_level(uint8_t level);

    /**
     * Merge JSON (partial updates supported)
     * @return Builder for chaining
     */
    SyncSettingsBuilder& merge_json(const char* json);

    /**
     * Reset to factory defaults (true) or reload from NVS (false)
     * @return Builder for chaining (call commit() to persist)
     */
    SyncSettingsBuilder& reset(bool factoryReset);

    /**
     * Validate runtime settings with this builder's changes applied
     * @return true if valid, false otherwise (check get_last_error())
     */
    [[nodiscard]] bool validate();

    /**
     * Transactional commit: validate -> save to NVS -> swap into runtime
     * @param save If true, persist to NVS before applying to runtime
     * @return true if successful or nothing was modified (no NVS write), false otherwise (check get_last_error())
     */
    [[nodiscard]] bool commit(bool save = true);

    /** @return true if any modifications are pending */
    bool is_modified() const noexcept;

    /** @return Error message string, or nullptr if no error */
    const char* get_last_error() const noexcept;

    SyncSettingsBuilder(SyncSettingsBuilder&& other) noexcept = default;
    ~SyncSettingsBuilder() = default;

private:
    friend SyncSettingsBuilder SyncSettings::modify();
    SyncSettingsBuilder();

    // NOLINTBEGIN
    SyncSettingsBuilder(const SyncSettingsBuilder&) = delete;
    SyncSettingsBuilder& operator=(const SyncSettingsBuilder&) = delete;
    SyncSettingsBuilder& operator=(SyncSettingsBuilder&&) = delete;
    // NOLINTEND

    void set_error(const char* error);
    void apply_changes_to(SyncConfig& merged) const;

    enum DirtyBits : uint16_t {
        DIRTY_SENSOR_ADDRESS     = 0x0001,
        DIRTY_SCAN_TIMEOUT       = 0x0002,
        DIRTY_CIRCUMFERENCE      = 0x0004,
        DIRTY_SPEED_UNITS        = 0x0008,
        DIRTY_SMOOTHING_WINDOW   = 0x0010,
        DIRTY_SPEED_THRESHOLD    = 0x0020,
        DIRTY_VIDEO_FILE_PATH    = 0x0040,
        DIRTY_UPDATE_INTERVAL    = 0x0080,
        DIRTY_SPEED_MULTIPLIER   = 0x0100,
        DIRTY_DISPLAY_SPEED      = 0x0200,
        DIRTY_WINDOW_SCALE       = 0x0400,
        DIRTY_LOG_LEVEL          = 0x0800,
        DIRTY_ALL                = 0x0FFF
    };

    SyncConfig working_copy_;
    uint16_t dirty_flags_;
    const char* error_;  // nullptr = no error
};

}  // namespace cscsync

#endif // CSCSYNC_SETTINGS_H
