#include "cscsync/settings.h"
#include "cscsync/log.h"

#include <Preferences.h>
#include <ArduinoJson.h>

#include <chrono>
#include <cmath>
#include <cstring>
#include <ctype.h>
#include <mutex>

namespace cscsync {

// Compile-time verification: NVS binary compatibility
static_assert(sizeof(float) == 4, "Requires IEEE 754 32-bit float for NVS compatibility");
static_assert(sizeof(csc::SpeedUnits) == 1, "SpeedUnits size changed - verify NVS compatibility");

static SyncConfig g_config;
static std::timed_mutex g_config_mutex;  // Prevents torn reads/writes
static constexpr auto MUTEX_TIMEOUT = std::chrono::milliseconds(1000);

// NVS storage configuration
constexpr const char* NVS_NAMESPACE = "csc_sync";
constexpr const char* NVS_KEY_CONFIG = "sync_cfg";

// Console line limit
static constexpr size_t MAX_JSON_SIZE = 511;
static constexpr size_t MAX_JSON_NESTING_DEPTH = 10;

// Range limits
static constexpr uint32_t MAX_SCAN_TIMEOUT_SECS = 600;
static constexpr uint32_t MIN_UPDATE_INTERVAL_MS = 100;
static constexpr uint32_t MAX_UPDATE_INTERVAL_MS = 60000;
static constexpr uint32_t MAX_SMOOTHING_WINDOW = 64;

static constexpr SyncConfig FACTORY_DEFAULTS = {
    .sensor_address = "f1:42:d8:66:fb:fe",
    .scan_timeout_secs = 30,
    .wheel_circumference_mm = 2155.0f,
    .speed_units = csc::SpeedUnits::KilometersPerHour,
    .smoothing_window = 5,
    .speed_threshold = 0.25f,
    .video_file_path = "cycling_test.mp4",
    .update_interval_ms = 1000,
    .speed_multiplier = 0.8f,
    .display_speed = true,
    .window_scale = 1.0f,
    .log_level = CSCSYNC_LOG_LEVEL_INFO
};

extern "C" uint32_t crc32_le(uint32_t crc, const uint8_t* buf, uint32_t len);

namespace nvs {
    struct NvsBlob {
        SyncConfig data;
        uint32_t checksum;
    };

    static uint32_t compute_crc32(const void* data, size_t size) {
        return crc32_le(0, static_cast<const uint8_t*>(data), size);
    }

    static bool load(SyncConfig* config) {
        Preferences prefs;
        if (!prefs.begin(NVS_NAMESPACE, true)) {
            return false;
        }

        NvsBlob blob;
        const size_t bytes_read = prefs.getBytes(NVS_KEY_CONFIG, &blob, sizeof(NvsBlob));
        prefs.end();

        if (bytes_read != sizeof(NvsBlob)) {
            CSCSYNC_LOG_WARN("[CFG] NVS data size mismatch (%u bytes, expected %u)\n",
                             static_cast<unsigned int>(bytes_read),
                             static_cast<unsigned int>(sizeof(NvsBlob)));
            return false;
        }

        const uint32_t computed_crc = compute_crc32(&blob.data, sizeof(blob.data));
        if (computed_crc != blob.checksum) {
            CSCSYNC_LOG_ERROR("[CFG] NVS checksum mismatch (computed 0x%08X, stored 0x%08X)\n",
                              static_cast<unsigned int>(computed_crc),
                              static_cast<unsigned int>(blob.checksum));
            return false;
        }

        const char* error = nullptr;
        if (!validate_config(blob.data, &error)) {
            CSCSYNC_LOG_ERROR("[CFG] Stored configuration rejected: %s\n", error);
            return false;
        }

        *config = blob.data;
        return true;
    }

    static bool save(const SyncConfig* config) {
        NvsBlob blob;
        memset(&blob, 0, sizeof(blob));
        blob.data = *config;
        blob.checksum = compute_crc32(&blob.data, sizeof(blob.data));

        Preferences prefs;
        if (!prefs.begin(NVS_NAMESPACE, false)) {
            CSCSYNC_LOG_ERROR("[CFG] Could not open NVS namespace %s\n", NVS_NAMESPACE);
            return false;
        }
        const size_t bytes_written = prefs.putBytes(NVS_KEY_CONFIG, &blob, sizeof(NvsBlob));
        prefs.end();

        if (bytes_written != sizeof(NvsBlob)) {
            CSCSYNC_LOG_ERROR("[CFG] Failed to save configuration to NVS (wrote %u of %u bytes)\n",
                              static_cast<unsigned int>(bytes_written),
                              static_cast<unsigned int>(sizeof(NvsBlob)));
            return false;
        }
        CSCSYNC_LOG_INFO("[CFG] Configuration saved to NVS (CRC32: 0x%08X)\n",
                         static_cast<unsigned int>(blob.checksum));
        return true;
    }
}

namespace {
    // Logs when a reader has to wait on a writer
    std::unique_lock<std::timed_mutex> lock_config() {
        std::unique_lock<std::timed_mutex> lock(g_config_mutex, MUTEX_TIMEOUT);
        if (!lock.owns_lock()) {
            CSCSYNC_LOG_WARN("[CFG] Settings mutex timeout (%dms) - blocking until acquired...\n",
                             static_cast<int>(MUTEX_TIMEOUT.count()));
            lock.lock();
        }
        return lock;
    }

    bool is_valid_address(const char* address) {
        if (strlen(address) != 17) {
            return false;
        }
        for (size_t i = 0; i < 17; ++i) {
            const bool separator = (i % 3) == 2;
            if (separator ? address[i] != ':' : !isxdigit(static_cast<unsigned char>(address[i]))) {
                return false;
            }
        }
        return true;
    }

    bool copy_string(char* dest, size_t dest_size, const char* src) {
        const size_t len = strlen(src);
        if (len >= dest_size) {
            return false;
        }
        memcpy(dest, src, len + 1);
        return true;
    }
}

const SyncConfig& factory_defaults() {
    return FACTORY_DEFAULTS;
}

bool validate_config(const SyncConfig& config, const char** error) {
    const char* failure = nullptr;

    if (memchr(config.sensor_address, '\0', sizeof(config.sensor_address)) == nullptr ||
        !is_valid_address(config.sensor_address)) {
        failure = "Invalid ble.sensor_address: expected xx:xx:xx:xx:xx:xx";
    } else if (config.scan_timeout_secs < 1 || config.scan_timeout_secs > MAX_SCAN_TIMEOUT_SECS) {
        failure = "Invalid ble.scan_timeout_secs: must be 1..600";
    } else if (!std::isfinite(config.wheel_circumference_mm) || config.wheel_circumference_mm <= 0.0f) {
        failure = "Invalid speed.wheel_circumference_mm: must be > 0";
    } else if (config.speed_units != csc::SpeedUnits::KilometersPerHour &&
               config.speed_units != csc::SpeedUnits::MilesPerHour) {
        failure = "Invalid speed.speed_units: must be km/h or mph";
    } else if (config.smoothing_window < 1 || config.smoothing_window > MAX_SMOOTHING_WINDOW) {
        failure = "Invalid speed.smoothing_window: must be 1..64";
    } else if (!std::isfinite(config.speed_threshold) || config.speed_threshold < 0.0f) {
        failure = "Invalid speed.speed_threshold: must be >= 0";
    } else if (memchr(config.video_file_path, '\0', sizeof(config.video_file_path)) == nullptr ||
               config.video_file_path[0] == '\0') {
        failure = "Invalid video.file_path: must not be empty";
    } else if (config.update_interval_ms < MIN_UPDATE_INTERVAL_MS || config.update_interval_ms > MAX_UPDATE_INTERVAL_MS) {
        failure = "Invalid video.update_interval_ms: must be 100..60000";
    } else if (!std::isfinite(config.speed_multiplier) || config.speed_multiplier <= 0.0f) {
        failure = "Invalid video.speed_multiplier: must be > 0";
    } else if (!std::isfinite(config.window_scale) || config.window_scale <= 0.0f) {
        failure = "Invalid video.window_scale_factor: must be > 0";
    } else if (config.log_level > CSCSYNC_LOG_LEVEL_TRACE) {
        failure = "Invalid app.log_level";
    }

    if (failure && error) {
        *error = failure;
    }
    return failure == nullptr;
}

// ============================================================================
// Public API Implementation
// ============================================================================

const SyncSettings& SyncSettings::get() {
    static SyncSettings settings;
    static std::once_flag init_flag;

    std::call_once(init_flag, []() {
        if (nvs::load(&g_config)) {
            CSCSYNC_LOG_INFO("[CFG] Configuration loaded from NVS (sensor %s)\n", g_config.sensor_address);
        } else {
            CSCSYNC_LOG_WARN("[CFG] No saved configuration found, using factory defaults\n");
            g_config = FACTORY_DEFAULTS;
        }
    });

    return settings;
}

SyncSettingsBuilder SyncSettings::modify() {
    return SyncSettingsBuilder();
}

SyncConfig SyncSettings::snapshot() const {
    auto lock = lock_config();
    return g_config;
}

// ============================================================================
// Builder API Implementation
// ============================================================================

SyncSettingsBuilder::SyncSettingsBuilder()
    : working_copy_(FACTORY_DEFAULTS), dirty_flags_(0), error_(nullptr) {
}

void SyncSettingsBuilder::set_error(const char* error) {
    if (!error_) {
        error_ = error;
    }
}

void SyncSettingsBuilder::apply_changes_to(SyncConfig& merged) const {
    if (dirty_flags_ & DIRTY_SENSOR_ADDRESS) {
        memcpy(merged.sensor_address, working_copy_.sensor_address, sizeof(merged.sensor_address));
    }
    if (dirty_flags_ & DIRTY_SCAN_TIMEOUT) {
        merged.scan_timeout_secs = working_copy_.scan_timeout_secs;
    }
    if (dirty_flags_ & DIRTY_CIRCUMFERENCE) {
        merged.wheel_circumference_mm = working_copy_.wheel_circumference_mm;
    }
    if (dirty_flags_ & DIRTY_SPEED_UNITS) {
        merged.speed_units = working_copy_.speed_units;
    }
    if (dirty_flags_ & DIRTY_SMOOTHING_WINDOW) {
        merged.smoothing_window = working_copy_.smoothing_window;
    }
    if (dirty_flags_ & DIRTY_SPEED_THRESHOLD) {
        merged.speed_threshold = working_copy_.speed_threshold;
    }
    if (dirty_flags_ & DIRTY_VIDEO_FILE_PATH) {
        memcpy(merged.video_file_path, working_copy_.video_file_path, sizeof(merged.video_file_path));
    }
    if (dirty_flags_ & DIRTY_UPDATE_INTERVAL) {
        merged.update_interval_ms = working_copy_.update_interval_ms;
    }
    if (dirty_flags_ & DIRTY_SPEED_MULTIPLIER) {
        merged.speed_multiplier = working_copy_.speed_multiplier;
    }
    if (dirty_flags_ & DIRTY_DISPLAY_SPEED) {
        merged.display_speed = working_copy_.display_speed;
    }
    if (dirty_flags_ & DIRTY_WINDOW_SCALE) {
        merged.window_scale = working_copy_.window_scale;
    }
    if (dirty_flags_ & DIRTY_LOG_LEVEL) {
        merged.log_level = working_copy_.log_level;
    }
}

// ---- BLE ----

SyncSettingsBuilder& SyncSettingsBuilder::set_sensor_address(const char* address) {
    if (!address || !copy_string(working_copy_.sensor_address, sizeof(working_copy_.sensor_address), address)) {
        set_error("Invalid ble.sensor_address: expected xx:xx:xx:xx:xx:xx");
        return *this;
    }
    dirty_flags_ |= DIRTY_SENSOR_ADDRESS;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_scan_timeout_secs(const uint32_t seconds) {
    working_copy_.scan_timeout_secs = seconds;
    dirty_flags_ |= DIRTY_SCAN_TIMEOUT;
    return *this;
}

// ---- Speed ----

SyncSettingsBuilder& SyncSettingsBuilder::set_wheel_circumference_mm(const float mm) {
    working_copy_.wheel_circumference_mm = mm;
    dirty_flags_ |= DIRTY_CIRCUMFERENCE;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_speed_units(const csc::SpeedUnits units) {
    working_copy_.speed_units = units;
    dirty_flags_ |= DIRTY_SPEED_UNITS;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_smoothing_window(const uint32_t samples) {
    working_copy_.smoothing_window = samples;
    dirty_flags_ |= DIRTY_SMOOTHING_WINDOW;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_speed_threshold(const float threshold) {
    working_copy_.speed_threshold = threshold;
    dirty_flags_ |= DIRTY_SPEED_THRESHOLD;
    return *this;
}

// ---- Video ----

SyncSettingsBuilder& SyncSettingsBuilder::set_video_file_path(const char* path) {
    if (!path || !copy_string(working_copy_.video_file_path, sizeof(working_copy_.video_file_path), path)) {
        set_error("Invalid video.file_path: too long");
        return *this;
    }
    dirty_flags_ |= DIRTY_VIDEO_FILE_PATH;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_update_interval_ms(const uint32_t ms) {
    working_copy_.update_interval_ms = ms;
    dirty_flags_ |= DIRTY_UPDATE_INTERVAL;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_speed_multiplier(const float multiplier) {
    working_copy_.speed_multiplier = multiplier;
    dirty_flags_ |= DIRTY_SPEED_MULTIPLIER;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_display_speed(const bool display) {
    working_copy_.display_speed = display;
    dirty_flags_ |= DIRTY_DISPLAY_SPEED;
    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::set_window_scale(const float scale) {
    working_copy_.window_scale = scale;
    dirty_flags_ |= DIRTY_WINDOW_SCALE;
    return *this;
}

// ---- App ----

SyncSettingsBuilder& SyncSettingsBuilder::set_log_level(const uint8_t level) {
    working_copy_.log_level = level;
    dirty_flags_ |= DIRTY_LOG_LEVEL;
    return *this;
}

// ---- JSON API (partial merge) ----

SyncSettingsBuilder& SyncSettingsBuilder::merge_json(const char* json) {
    if (!json) {
        set_error("JSON input is null");
        CSCSYNC_LOG_ERROR("[CFG] JSON input is null\n");
        return *this;
    }

    const size_t json_len = strlen(json);
    if (json_len > MAX_JSON_SIZE) {
        set_error("JSON too large");
        CSCSYNC_LOG_ERROR("[CFG] JSON size (%u bytes) exceeds limit (%u bytes)\n",
                          static_cast<unsigned int>(json_len),
                          static_cast<unsigned int>(MAX_JSON_SIZE));
        return *this;
    }

    JsonDocument doc;
    const DeserializationError error = deserializeJson(
        doc, json, DeserializationOption::NestingLimit(MAX_JSON_NESTING_DEPTH));
    if (error) {
        set_error("JSON parse error");
        CSCSYNC_LOG_ERROR("[CFG] JSON parse error: %s\n", error.c_str());
        return *this;
    }

    if (doc["app"]["log_level"].is<const char*>()) {
        uint8_t level = 0;
        if (log::parseLevel(doc["app"]["log_level"].as<const char*>(), level)) {
            set_log_level(level);
            CSCSYNC_LOG_DEBUG("[CFG]   updated app.log_level: %s\n", log::levelName(level));
        } else {
            set_error("Invalid app.log_level");
        }
    } else if (!doc["app"]["log_level"].isNull()) {
        set_error("Invalid app.log_level: wrong type");
    }

    JsonObject ble = doc["ble"];
    if (ble) {
        if (ble["sensor_address"].is<const char*>()) {
            set_sensor_address(ble["sensor_address"].as<const char*>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated ble.sensor_address\n");
        } else if (!ble["sensor_address"].isNull()) {
            set_error("Invalid ble.sensor_address: wrong type");
        }
        if (ble["scan_timeout_secs"].is<uint32_t>()) {
            set_scan_timeout_secs(ble["scan_timeout_secs"].as<uint32_t>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated ble.scan_timeout_secs\n");
        } else if (!ble["scan_timeout_secs"].isNull()) {
            set_error("Invalid ble.scan_timeout_secs: wrong type");
        }
    }

    JsonObject speed = doc["speed"];
    if (speed) {
        if (speed["wheel_circumference_mm"].is<float>()) {
            set_wheel_circumference_mm(speed["wheel_circumference_mm"].as<float>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated speed.wheel_circumference_mm\n");
        } else if (!speed["wheel_circumference_mm"].isNull()) {
            set_error("Invalid speed.wheel_circumference_mm: wrong type");
        }
        if (speed["speed_units"].is<const char*>()) {
            csc::SpeedUnits units;
            if (csc::parseUnits(speed["speed_units"].as<const char*>(), units)) {
                set_speed_units(units);
                CSCSYNC_LOG_DEBUG("[CFG]   updated speed.speed_units\n");
            } else {
                set_error("Invalid speed.speed_units: must be km/h or mph");
            }
        } else if (!speed["speed_units"].isNull()) {
            set_error("Invalid speed.speed_units: wrong type");
        }
        if (speed["smoothing_window"].is<uint32_t>()) {
            set_smoothing_window(speed["smoothing_window"].as<uint32_t>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated speed.smoothing_window\n");
        } else if (!speed["smoothing_window"].isNull()) {
            set_error("Invalid speed.smoothing_window: wrong type");
        }
        if (speed["speed_threshold"].is<float>()) {
            set_speed_threshold(speed["speed_threshold"].as<float>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated speed.speed_threshold\n");
        } else if (!speed["speed_threshold"].isNull()) {
            set_error("Invalid speed.speed_threshold: wrong type");
        }
    }

    JsonObject video = doc["video"];
    if (video) {
        if (video["file_path"].is<const char*>()) {
            set_video_file_path(video["file_path"].as<const char*>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated video.file_path\n");
        } else if (!video["file_path"].isNull()) {
            set_error("Invalid video.file_path: wrong type");
        }
        if (video["update_interval_ms"].is<uint32_t>()) {
            set_update_interval_ms(video["update_interval_ms"].as<uint32_t>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated video.update_interval_ms\n");
        } else if (!video["update_interval_ms"].isNull()) {
            set_error("Invalid video.update_interval_ms: wrong type");
        }
        if (video["speed_multiplier"].is<float>()) {
            set_speed_multiplier(video["speed_multiplier"].as<float>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated video.speed_multiplier\n");
        } else if (!video["speed_multiplier"].isNull()) {
            set_error("Invalid video.speed_multiplier: wrong type");
        }
        if (video["display_speed"].is<bool>()) {
            set_display_speed(video["display_speed"].as<bool>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated video.display_speed\n");
        } else if (!video["display_speed"].isNull()) {
            set_error("Invalid video.display_speed: wrong type");
        }
        if (video["window_scale_factor"].is<float>()) {
            set_window_scale(video["window_scale_factor"].as<float>());
            CSCSYNC_LOG_DEBUG("[CFG]   updated video.window_scale_factor\n");
        } else if (!video["window_scale_factor"].isNull()) {
            set_error("Invalid video.window_scale_factor: wrong type");
        }
    }

    return *this;
}

SyncSettingsBuilder& SyncSettingsBuilder::reset(const bool factoryReset) {
    if (factoryReset) {
        working_copy_ = FACTORY_DEFAULTS;
        CSCSYNC_LOG_INFO("[CFG] Factory defaults applied (not saved)\n");
    } else if (nvs::load(&working_copy_)) {
        CSCSYNC_LOG_INFO("[CFG] Settings reloaded from NVS\n");
    } else {
        working_copy_ = FACTORY_DEFAULTS;
        CSCSYNC_LOG_INFO("[CFG] No saved settings, applying factory defaults\n");
    }
    dirty_flags_ = DIRTY_ALL;
    return *this;
}

bool SyncSettingsBuilder::validate() {
    if (error_) {
        return false;
    }
    SyncConfig merged;
    {
        auto lock = lock_config();
        merged = g_config;
    }
    apply_changes_to(merged);

    const char* failure = nullptr;
    if (!validate_config(merged, &failure)) {
        set_error(failure);
        return false;
    }
    return true;
}

bool SyncSettingsBuilder::commit(const bool save) {
    if (error_ != nullptr) {
        CSCSYNC_LOG_ERROR("[CFG] Commit failed: %s\n", error_);
        return false;
    }

    // Loads NVS on first use, before the lock is taken
    SyncSettings::get();

    if (dirty_flags_ == 0) {
        CSCSYNC_LOG_DEBUG("[CFG] Nothing to commit\n");
        return true;
    }

    std::lock_guard<std::timed_mutex> lock(g_config_mutex);

    SyncConfig merged = g_config;
    apply_changes_to(merged);

    const char* failure = nullptr;
    if (!validate_config(merged, &failure)) {
        set_error(failure);
        CSCSYNC_LOG_ERROR("[CFG] Commit failed: %s\n", failure);
        return false;
    }

    if (save && !nvs::save(&merged)) {
        set_error("NVS save failed");
        return false;
    }

    g_config = merged;
    dirty_flags_ = 0;
    return true;
}

bool SyncSettingsBuilder::is_modified() const noexcept {
    return dirty_flags_ != 0;
}

const char* SyncSettingsBuilder::get_last_error() const noexcept {
    return error_;
}

// ============================================================================
// JSON Serialization
// ============================================================================

size_t SyncSettings::to_json(char* buffer, const size_t buffer_size) const {
    if (!buffer || buffer_size == 0) {
        CSCSYNC_LOG_ERROR("[CFG] to_json: invalid buffer (nullptr or zero size)\n");
        return 0;
    }

    const SyncConfig config = snapshot();

    JsonDocument doc;

    JsonObject app = doc["app"].to<JsonObject>();
    app["log_level"] = log::levelName(config.log_level);

    JsonObject ble = doc["ble"].to<JsonObject>();
    ble["sensor_address"] = config.sensor_address;
    ble["scan_timeout_secs"] = config.scan_timeout_secs;

    JsonObject speed = doc["speed"].to<JsonObject>();
    speed["wheel_circumference_mm"] = config.wheel_circumference_mm;
    speed["speed_units"] = csc::unitsLabel(config.speed_units);
    speed["smoothing_window"] = config.smoothing_window;
    speed["speed_threshold"] = config.speed_threshold;

    JsonObject video = doc["video"].to<JsonObject>();
    video["file_path"] = config.video_file_path;
    video["update_interval_ms"] = config.update_interval_ms;
    video["speed_multiplier"] = config.speed_multiplier;
    video["display_speed"] = config.display_speed;
    video["window_scale_factor"] = config.window_scale;

    JsonObject metadata = doc["metadata"].to<JsonObject>();
    metadata["version"] = SyncSettings::SCHEMA_VERSION;

    const size_t required = measureJson(doc);
    if (required >= buffer_size) {
        CSCSYNC_LOG_ERROR("[CFG] to_json: buffer too small (need %u bytes, have %u)\n",
                          static_cast<unsigned int>(required + 1),
                          static_cast<unsigned int>(buffer_size));
        return 0;
    }

    const size_t written = serializeJson(doc, buffer, buffer_size);
    if (written != required) {
        CSCSYNC_LOG_ERROR("[CFG] to_json: serialization size mismatch (expected %u, got %u)\n",
                          static_cast<unsigned int>(required),
                          static_cast<unsigned int>(written));
        buffer[0] = '\0';
        return 0;
    }
    return written;
}

}  // namespace cscsync
