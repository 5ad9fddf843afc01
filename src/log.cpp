#include "cscsync/log.h"

#include <atomic>
#include <strings.h>

namespace cscsync::log {
    namespace {
        std::atomic<uint8_t> g_level{CSCSYNC_LOG_LEVEL};

        constexpr const char* LEVEL_NAMES[] = {"none", "error", "warn", "info", "debug", "trace"};
        constexpr uint8_t LEVEL_COUNT = sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]);
    }

    void setLevel(const uint8_t level) noexcept {
        g_level.store(level < LEVEL_COUNT ? level : LEVEL_COUNT - 1, std::memory_order_relaxed);
    }

    uint8_t level() noexcept {
        return g_level.load(std::memory_order_relaxed);
    }

    bool parseLevel(const char* name, uint8_t& out) noexcept {
        if (!name) {
            return false;
        }
        for (uint8_t i = 0; i < LEVEL_COUNT; ++i) {
            if (strcasecmp(name, LEVEL_NAMES[i]) == 0) {
                out = i;
                return true;
            }
        }
        return false;
    }

    const char* levelName(const uint8_t level) noexcept {
        return level < LEVEL_COUNT ? LEVEL_NAMES[level] : "trace";
    }
}  // namespace cscsync::log
