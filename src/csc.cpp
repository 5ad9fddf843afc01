#include "cscsync/csc.hpp"

#include <cstring>

namespace cscsync::csc {

namespace {
    uint32_t readU32(const uint8_t* p) {
        return static_cast<uint32_t>(p[0])
             | static_cast<uint32_t>(p[1]) << 8
             | static_cast<uint32_t>(p[2]) << 16
             | static_cast<uint32_t>(p[3]) << 24;
    }

    uint16_t readU16(const uint8_t* p) {
        return static_cast<uint16_t>(p[0] | p[1] << 8);
    }
}

bool parseUnits(const char* label, SpeedUnits& out) noexcept {
    if (!label) {
        return false;
    }
    if (strcmp(label, "km/h") == 0) {
        out = SpeedUnits::KilometersPerHour;
        return true;
    }
    if (strcmp(label, "mph") == 0) {
        out = SpeedUnits::MilesPerHour;
        return true;
    }
    return false;
}

bool CscDecoder::parseSample(const uint8_t* payload, const size_t length, CscSample& out) noexcept {
    if (!payload || length < 1) {
        return false;
    }
    if (!(payload[0] & WHEEL_REVOLUTION_DATA_PRESENT) || length < WHEEL_DATA_LENGTH) {
        return false;
    }
    out.flags = payload[0];
    out.cumulativeWheelRevolutions = readU32(payload + 1);
    out.lastWheelEventTime = readU16(payload + 5);
    return true;
}

DecodeResult CscDecoder::decode(const uint8_t* payload, const size_t length,
                                const DecoderState& state) const noexcept {
    CscSample sample;
    if (!parseSample(payload, length, sample)) {
        return {0.0f, state};
    }

    const DecoderState next{sample.cumulativeWheelRevolutions, sample.lastWheelEventTime};

    if (state.previousWheelEventTime == 0) {
        return {0.0f, next};
    }

    const uint16_t timeDiff = static_cast<uint16_t>(sample.lastWheelEventTime - state.previousWheelEventTime);
    if (timeDiff == 0) {
        return {0.0f, state};
    }

    const int32_t revDiff = static_cast<int32_t>(sample.cumulativeWheelRevolutions - state.previousWheelRevolutions);
    const float speed = static_cast<float>(revDiff) * circumferenceMm_ * conversionFactor(units_)
                      / static_cast<float>(timeDiff);

    return {speed, next};
}

}  // namespace cscsync::csc
