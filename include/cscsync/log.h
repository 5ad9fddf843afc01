/**
 * @file log.h
 * @brief Leveled logging - compile-time ceiling plus runtime threshold
 *
 * @details
 * Lightweight logging macros that compile to no-ops above the build ceiling and
 * are filtered at runtime against the threshold loaded from settings
 * (`app.log_level`). Output goes to the Arduino `Serial` console.
 *
 * # Log Levels
 * - **ERROR**: Failures that end a run or a session
 * - **WARN**: Unexpected but recoverable conditions
 * - **INFO**: Discovery milestones and lifecycle events (default)
 * - **DEBUG**: Per-sample diagnostics
 * - **TRACE**: Very detailed trace information (most verbose)
 *
 * # Build Configuration
 * Set the ceiling at compile time (pick one method):
 *
 * **Method 1: Symbolic flags (recommended)**
 * - `-DCSCSYNC_LOG_LEVEL_TRACE` - Enable all logging (most verbose)
 * - `-DCSCSYNC_LOG_LEVEL_DEBUG` - Enable DEBUG and above
 * - `-DCSCSYNC_LOG_LEVEL_INFO` - Enable INFO and above (default)
 * - `-DCSCSYNC_LOG_LEVEL_WARN` - Enable WARN and above
 * - `-DCSCSYNC_LOG_LEVEL_ERROR` - Enable ERROR only
 * - `-DCSCSYNC_LOG_LEVEL_NONE` or `-DCSCSYNC_DISABLE_LOGGING` - Disable all logging
 *
 * **Method 2: Numeric level**
 * - `-DCSCSYNC_LOG_LEVEL=5` ... `-DCSCSYNC_LOG_LEVEL=0`
 *
 * @note If multiple symbolic flags are set, the most verbose wins
 *
 * # Usage
 * @code
 * CSCSYNC_LOG_INFO("[BLE] Found BLE peripheral %s\n", address);
 * CSCSYNC_LOG_DEBUG_BYTES("[BLE] RX: ", payload, length);
 * @endcode
 *
 * Messages carry a component tag: `[APP]`, `[BLE]`, `[SPEED]`, `[VIDEO]`, `[CFG]`.
 */

#ifndef CSCSYNC_LOG_H_
#define CSCSYNC_LOG_H_

#include <Arduino.h>
#include <cstdint>

// If multiple -DCSCSYNC_LOG_LEVEL_* flags are set, the most verbose wins
#ifndef CSCSYNC_LOG_LEVEL
  #define CSCSYNC_LOG_LEVEL 3  // INFO

  #if defined(CSCSYNC_DISABLE_LOGGING) || defined(CSCSYNC_LOG_LEVEL_NONE)
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 0
  #endif
  #ifdef CSCSYNC_LOG_LEVEL_ERROR
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 1
  #endif
  #ifdef CSCSYNC_LOG_LEVEL_WARN
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 2
  #endif
  #ifdef CSCSYNC_LOG_LEVEL_INFO
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 3
  #endif
  #ifdef CSCSYNC_LOG_LEVEL_DEBUG
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 4
  #endif
  #ifdef CSCSYNC_LOG_LEVEL_TRACE
    #undef CSCSYNC_LOG_LEVEL
    #define CSCSYNC_LOG_LEVEL 5
  #endif
#endif

// Numeric constants for comparisons in user code (defined after the ceiling is resolved)
#define CSCSYNC_LOG_LEVEL_NONE  0
#define CSCSYNC_LOG_LEVEL_ERROR 1
#define CSCSYNC_LOG_LEVEL_WARN  2
#define CSCSYNC_LOG_LEVEL_INFO  3
#define CSCSYNC_LOG_LEVEL_DEBUG 4
#define CSCSYNC_LOG_LEVEL_TRACE 5

namespace cscsync::log {
    /// Set the runtime threshold (clamped to the compile-time ceiling when printing)
    void setLevel(uint8_t level) noexcept;

    /// Current runtime threshold
    [[nodiscard]] uint8_t level() noexcept;

    /**
     * @brief Parse a level name ("none", "error", "warn", "info", "debug", "trace")
     * @return false if the name is unknown (out is left untouched)
     */
    [[nodiscard]] bool parseLevel(const char* name, uint8_t& out) noexcept;

    /// Level name for settings serialization
    [[nodiscard]] const char* levelName(uint8_t level) noexcept;
}  // namespace cscsync::log

#define CSCSYNC_LOG_ENABLED(n) (::cscsync::log::level() >= (n))

// Logging macros (compile out completely above the ceiling)
#if CSCSYNC_LOG_LEVEL >= 1
  #define CSCSYNC_LOG_ERROR(...) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_ERROR)) Serial.printf("CSC:E " __VA_ARGS__); \
  } while (0)
#else
  #define CSCSYNC_LOG_ERROR(...) ((void)0)
#endif

#if CSCSYNC_LOG_LEVEL >= 2
  #define CSCSYNC_LOG_WARN(...) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_WARN)) Serial.printf("CSC:W " __VA_ARGS__); \
  } while (0)
#else
  #define CSCSYNC_LOG_WARN(...) ((void)0)
#endif

#if CSCSYNC_LOG_LEVEL >= 3
  #define CSCSYNC_LOG_INFO(...) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_INFO)) Serial.printf("CSC:I " __VA_ARGS__); \
  } while (0)
#else
  #define CSCSYNC_LOG_INFO(...) ((void)0)
#endif

#if CSCSYNC_LOG_LEVEL >= 4
  #define CSCSYNC_LOG_DEBUG(...) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_DEBUG)) Serial.printf("CSC:D " __VA_ARGS__); \
  } while (0)
  #define CSCSYNC_LOG_DEBUG_BYTES(prefix, data, size) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_DEBUG)) { \
      Serial.printf("CSC:D %s", prefix); \
      for (size_t _i = 0; _i < (size) && _i < 16; ++_i) { \
        Serial.printf("%02X ", ((const uint8_t*)(data))[_i]); \
      } \
      if ((size) > 16) Serial.printf("..."); \
      Serial.printf("\n"); \
    } \
  } while (0)
#else
  #define CSCSYNC_LOG_DEBUG(...) ((void)0)
  #define CSCSYNC_LOG_DEBUG_BYTES(prefix, data, size) ((void)0)
#endif

#if CSCSYNC_LOG_LEVEL >= 5
  #define CSCSYNC_LOG_TRACE(...) do { \
    if (CSCSYNC_LOG_ENABLED(CSCSYNC_LOG_LEVEL_TRACE)) Serial.printf("CSC:T " __VA_ARGS__); \
  } while (0)
#else
  #define CSCSYNC_LOG_TRACE(...) ((void)0)
#endif

#endif // CSCSYNC_LOG_H_
