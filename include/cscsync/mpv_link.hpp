/**
 * @file mpv_link.hpp
 * @brief mpv JSON IPC over an Arduino Print
 *
 * @details
 * Each command is one JSON object terminated by a newline, the framing mpv
 * uses on its `--input-ipc-server` socket. A host-side bridge forwards the
 * serial lines to that socket.
 *
 * @code
 * {"command":["set_property","speed",1.25],"request_id":7}
 * @endcode
 *
 * Replies are not read back: a command fails only if it cannot be written.
 */

#ifndef CSCSYNC_MPV_LINK_HPP_
#define CSCSYNC_MPV_LINK_HPP_

#include <Arduino.h>
#include <ArduinoJson.h>

#include <cstdint>

namespace cscsync {

class MpvLink {
public:
    static constexpr float kMinSpeed = 0.01f;
    static constexpr float kMaxSpeed = 100.0f;

    explicit MpvLink(Print& out) : out_(out) {}

    bool loadFile(const char* path);

    /// Playback rate, clamped to what mpv accepts
    bool setSpeed(float speed);

    bool setPaused(bool paused);

    /// On-screen text for durationMs
    bool showText(const char* text, uint32_t durationMs);

    bool setWindowScale(float scale);

    /// Identifier of the last command sent
    [[nodiscard]] uint32_t lastRequestId() const noexcept { return requestId_; }

private:
    bool send(JsonDocument& doc);

    Print& out_;
    uint32_t requestId_ = 0;
};

}  // namespace cscsync

#endif // CSCSYNC_MPV_LINK_HPP_
