/**
 * @file csc.hpp
 * @brief Cycling Speed and Cadence measurement decoding
 *
 * @details
 * Wire layout of the CSC Measurement characteristic (0x2A5B), wheel data only:
 *
 * | Offset | Size | Field                                        |
 * |--------|------|----------------------------------------------|
 * | 0      | 1    | flags (bit 0: wheel revolution data present) |
 * | 1      | 4    | cumulative wheel revolutions (uint32 LE)     |
 * | 5      | 2    | last wheel event time (uint16 LE, 1/1024 s)  |
 *
 * Crank data that may follow is ignored.
 *
 * The decoder is pure: the previous sample travels in a `DecoderState` owned by
 * the caller, and every call returns the state to use for the next payload.
 */

#ifndef CSCSYNC_CSC_HPP_
#define CSCSYNC_CSC_HPP_

#include <cstddef>
#include <cstdint>

namespace cscsync::csc {

inline constexpr uint16_t SERVICE_UUID = 0x1816;
inline constexpr uint16_t MEASUREMENT_UUID = 0x2A5B;

inline constexpr uint8_t WHEEL_REVOLUTION_DATA_PRESENT = 0x01;
inline constexpr size_t WHEEL_DATA_LENGTH = 7;

enum class SpeedUnits : uint8_t {
    KilometersPerHour,
    MilesPerHour
};

/// Multiplier turning mm per 1/1024 s into the display unit
constexpr float conversionFactor(const SpeedUnits units) noexcept {
    return units == SpeedUnits::MilesPerHour ? 2.23694f : 3.6f;
}

constexpr const char* unitsLabel(const SpeedUnits units) noexcept {
    return units == SpeedUnits::MilesPerHour ? "mph" : "km/h";
}

/**
 * @brief Parse a units label ("km/h" or "mph")
 * @return false for anything else (out is left untouched)
 */
bool parseUnits(const char* label, SpeedUnits& out) noexcept;

struct CscSample {
    uint8_t flags = 0;
    uint32_t cumulativeWheelRevolutions = 0;
    uint16_t lastWheelEventTime = 0;
};

struct DecoderState {
    uint32_t previousWheelRevolutions = 0;
    uint16_t previousWheelEventTime = 0;  ///< 0 means no baseline yet
};

struct DecodeResult {
    float speed;
    DecoderState state;
};

class CscDecoder {
public:
    CscDecoder(float wheelCircumferenceMm, SpeedUnits units) noexcept
        : circumferenceMm_(wheelCircumferenceMm), units_(units) {}

    /**
     * @brief Decode one notification against the previous sample
     *
     * Short payloads, a cleared wheel bit, the first sample after a reset and
     * a zero time delta all give a speed of 0. Only a computed speed or a new
     * baseline advances the returned state; otherwise it equals `state`.
     */
    [[nodiscard]] DecodeResult decode(const uint8_t* payload, size_t length,
                                      const DecoderState& state) const noexcept;

    /// Raw fields of a payload; false if it carries no wheel data
    static bool parseSample(const uint8_t* payload, size_t length, CscSample& out) noexcept;

    float circumferenceMm() const noexcept { return circumferenceMm_; }
    SpeedUnits units() const noexcept { return units_; }

private:
    float circumferenceMm_;
    SpeedUnits units_;
};

}  // namespace cscsync::csc

#endif // CSCSYNC_CSC_HPP_
