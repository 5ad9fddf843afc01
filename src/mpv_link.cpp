#include "cscsync/mpv_link.hpp"
#include "cscsync/core.hpp"
#include "cscsync/log.h"

namespace cscsync {

static_assert(cscsync_core::PlaybackSink<MpvLink>);

// One command line, newline included
static constexpr size_t MAX_COMMAND_SIZE = 256;

bool MpvLink::loadFile(const char* path) {
    if (!path || !*path) {
        CSCSYNC_LOG_ERROR("[VIDEO] No video file configured\n");
        return false;
    }
    JsonDocument doc;
    JsonArray command = doc["command"].to<JsonArray>();
    command.add("loadfile");
    command.add(path);
    command.add("replace");
    return send(doc);
}

bool MpvLink::setSpeed(float speed) {
    if (speed < kMinSpeed) {
        speed = kMinSpeed;
    } else if (speed > kMaxSpeed) {
        speed = kMaxSpeed;
    }
    JsonDocument doc;
    JsonArray command = doc["command"].to<JsonArray>();
    command.add("set_property");
    command.add("speed");
    command.add(speed);
    return send(doc);
}

bool MpvLink::setPaused(const bool paused) {
    JsonDocument doc;
    JsonArray command = doc["command"].to<JsonArray>();
    command.add("set_property");
    command.add("pause");
    command.add(paused);
    return send(doc);
}

bool MpvLink::showText(const char* text, const uint32_t durationMs) {
    JsonDocument doc;
    JsonArray command = doc["command"].to<JsonArray>();
    command.add("show-text");
    command.add(text ? text : "");
    command.add(durationMs);
    return send(doc);
}

bool MpvLink::setWindowScale(const float scale) {
    JsonDocument doc;
    JsonArray command = doc["command"].to<JsonArray>();
    command.add("set_property");
    command.add("window-scale");
    command.add(scale);
    return send(doc);
}

bool MpvLink::send(JsonDocument& doc) {
    doc["request_id"] = ++requestId_;

    char line[MAX_COMMAND_SIZE];
    const size_t required = measureJson(doc);
    if (required + 1 >= sizeof(line)) {
        CSCSYNC_LOG_ERROR("[VIDEO] mpv command too large (%u bytes)\n", static_cast<unsigned int>(required));
        return false;
    }

    const size_t written = serializeJson(doc, line, sizeof(line));
    line[written] = '\n';

    // One write per command line
    const size_t sent = out_.write(reinterpret_cast<const uint8_t*>(line), written + 1);
    if (sent != written + 1) {
        CSCSYNC_LOG_ERROR("[VIDEO] mpv link write failed (%u of %u bytes)\n",
                          static_cast<unsigned int>(sent), static_cast<unsigned int>(written + 1));
        return false;
    }
    CSCSYNC_LOG_TRACE("[VIDEO] -> %.*s", static_cast<int>(written + 1), line);
    return true;
}

}  // namespace cscsync
