/**
 * @file playback.hpp
 * @brief Playback controller - smoothed speed into the video player
 *
 * @details
 * Loads the configured video paused, then on every update interval reads the
 * smoothed speed and drives the player:
 * - below the threshold: pause (sent only when the state changes)
 * - otherwise: playback rate = speed x multiplier, then resume if paused
 *
 * @tparam Sink Playback sink (see core.hpp), normally an MpvLink
 */

#ifndef CSCSYNC_PLAYBACK_HPP_
#define CSCSYNC_PLAYBACK_HPP_

#include "context.hpp"
#include "core.hpp"
#include "csc.hpp"
#include "error.hpp"
#include "log.h"

#include <cstdio>

namespace cscsync {

struct PlaybackOptions {
    const char* filePath = nullptr;
    uint32_t updateIntervalMs = 1000;
    float speedMultiplier = 1.0f;
    float speedThreshold = 0.0f;
    bool displaySpeed = false;
    float windowScale = 1.0f;
    csc::SpeedUnits units = csc::SpeedUnits::KilometersPerHour;
};

template<cscsync_core::PlaybackSink Sink>
class PlaybackController {
public:
    PlaybackController(Sink& sink, const PlaybackOptions& options) : sink_(sink), options_(options) {}

    /**
     * @brief Drive playback until the context completes
     * @return Error::None on cancellation, PlaybackFailed if the sink rejects a command
     */
    template<cscsync_core::SpeedSource Source>
    [[nodiscard]] Error run(Context& ctx, const Source& speed) {
        CSCSYNC_LOG_INFO("[VIDEO] Starting video playback of %s\n", options_.filePath);

        if (!sink_.setWindowScale(options_.windowScale)) {
            return fail("window scale");
        }
        if (!sink_.loadFile(options_.filePath)) {
            return fail("load file");
        }
        if (!sink_.setPaused(true)) {
            return fail("pause");
        }
        bool paused = true;

        while (!ctx.wait(options_.updateIntervalMs)) {
            const float current = speed.smoothedSpeed();
            CSCSYNC_LOG_DEBUG("[VIDEO] Sensor speed buffer smoothed to %.2f %s\n",
                              current, csc::unitsLabel(options_.units));

            if (options_.displaySpeed) {
                char text[48];
                snprintf(text, sizeof(text), "Speed: %.2f %s", current, csc::unitsLabel(options_.units));
                if (!sink_.showText(text, options_.updateIntervalMs)) {
                    return fail("show text");
                }
            }

            if (current < options_.speedThreshold) {
                if (!paused) {
                    CSCSYNC_LOG_DEBUG("[VIDEO] No speed detected, so pausing video\n");
                    if (!sink_.setPaused(true)) {
                        return fail("pause");
                    }
                    paused = true;
                }
                continue;
            }

            const float rate = current * options_.speedMultiplier;
            if (!sink_.setSpeed(rate)) {
                return fail("set speed");
            }
            CSCSYNC_LOG_DEBUG("[VIDEO] Adjusting video speed to %.2f\n", rate);
            if (paused) {
                if (!sink_.setPaused(false)) {
                    return fail("resume");
                }
                paused = false;
            }
        }

        if (!paused && !sink_.setPaused(true)) {
            CSCSYNC_LOG_WARN("[VIDEO] Could not pause video on shutdown\n");
        }
        CSCSYNC_LOG_INFO("[VIDEO] Playback stopped\n");
        return Error::None;
    }

private:
    Error fail(const char* command) {
        CSCSYNC_LOG_ERROR("[VIDEO] Player rejected command: %s\n", command);
        return Error::PlaybackFailed;
    }

    Sink& sink_;
    const PlaybackOptions options_;
};

}  // namespace cscsync

#endif // CSCSYNC_PLAYBACK_HPP_
