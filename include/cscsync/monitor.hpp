/**
 * @file monitor.hpp
 * @brief Notification monitor - CSC payloads into the speed controller
 *
 * @details
 * The notify callback runs on the BLE host task and only copies the payload
 * into a bounded queue. The monitor task drains the queue in arrival order,
 * decodes each payload and pushes the speed into the controller.
 *
 * # Wakeups
 * - **Payload**: a notification was received
 * - **Wake**: the context completed
 * - **LinkLost**: the central reported a disconnect
 *
 * A full queue drops the payload and counts it (`droppedCount()`).
 *
 * @tparam C Central backend (see core.hpp)
 * @tparam S Speed sink, normally a SpeedController
 */

#ifndef CSCSYNC_MONITOR_HPP_
#define CSCSYNC_MONITOR_HPP_

#include "context.hpp"
#include "core.hpp"
#include "csc.hpp"
#include "error.hpp"
#include "log.h"

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>

#include <atomic>
#include <cstring>

namespace cscsync {

template<cscsync_core::CentralBackend C, cscsync_core::SpeedSink S>
class NotificationMonitor {
public:
    using Characteristic = typename C::Characteristic;

    static constexpr size_t kQueueDepth = 16;
    static constexpr size_t kMaxPayload = 20;

    explicit NotificationMonitor(C& central)
        : central_(central),
          queue_(xQueueCreateStatic(kQueueDepth, sizeof(Item), queueStorage_, &queueBuffer_)) {
        configASSERT(queue_ != nullptr);
    }

    ~NotificationMonitor() { vQueueDelete(queue_); }

    NotificationMonitor(const NotificationMonitor&) = delete;
    NotificationMonitor& operator=(const NotificationMonitor&) = delete;

    /**
     * @brief Monitor notifications until the context completes or the link drops
     * @return Error::None on cancellation, SubscriptionFailed, or ConnectionLost
     * @note The decoder baseline starts fresh on every call
     */
    [[nodiscard]] Error run(Context& ctx, Characteristic& chr, const csc::CscDecoder& decoder, S& speed) {
        csc::DecoderState state{};
        xQueueReset(queue_);
        linkLost_.store(false, std::memory_order_relaxed);
        dropped_.store(0, std::memory_order_relaxed);

        central_.setDisconnectHandler([this](const int reason) {
            CSCSYNC_LOG_WARN("[BLE] Link lost while monitoring (reason=%d)\n", reason);
            linkLost_.store(true, std::memory_order_release);
            post(Kind::LinkLost);
        });

        CSCSYNC_LOG_INFO("[BLE] Starting real-time monitoring of BLE sensor notifications...\n");
        if (!central_.subscribe(chr, [this](const uint8_t* data, const size_t length) { enqueue(data, length); })) {
            central_.setDisconnectHandler(nullptr);
            CSCSYNC_LOG_ERROR("[BLE] %s\n", toString(Error::SubscriptionFailed));
            return Error::SubscriptionFailed;
        }

        Wakeup wakeup(*this);
        ctx.addListener(wakeup);

        Error result = Error::None;
        for (;;) {
            if (ctx.isDone()) {
                break;
            }
            if (linkLost_.load(std::memory_order_acquire)) {
                result = Error::ConnectionLost;
                break;
            }

            Item item;
            if (xQueueReceive(queue_, &item, portMAX_DELAY) != pdTRUE || item.kind != Kind::Payload) {
                continue;
            }

            CSCSYNC_LOG_DEBUG_BYTES("[BLE] RX: ", item.data, item.length);
            const csc::DecodeResult decoded = decoder.decode(item.data, item.length, state);
            state = decoded.state;
            speed.updateSpeed(decoded.speed);
            CSCSYNC_LOG_DEBUG("[SPEED] BLE sensor speed: %.2f %s\n",
                              decoded.speed, csc::unitsLabel(decoder.units()));
        }

        ctx.removeListener(wakeup);
        if (result != Error::ConnectionLost && !central_.unsubscribe(chr)) {
            CSCSYNC_LOG_WARN("[BLE] Failed to unsubscribe from notifications\n");
        }
        central_.setDisconnectHandler(nullptr);

        const uint32_t dropped = droppedCount();
        if (dropped > 0) {
            CSCSYNC_LOG_WARN("[BLE] %lu notifications dropped (queue full)\n", static_cast<unsigned long>(dropped));
        }
        CSCSYNC_LOG_INFO("[BLE] Monitoring stopped: %s\n", toString(result));
        return result;
    }

    /// Payloads dropped because the queue was full during the last run
    [[nodiscard]] uint32_t droppedCount() const noexcept {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    enum class Kind : uint8_t { Payload, Wake, LinkLost };

    struct Item {
        Kind kind;
        uint8_t length;
        uint8_t data[kMaxPayload];
    };

    struct Wakeup final : Context::Listener {
        explicit Wakeup(NotificationMonitor& m) : monitor(m) {}
        void onContextDone(Error) override { monitor.post(Kind::Wake); }
        NotificationMonitor& monitor;
    };

    // BLE host task: copy and hand off, never block
    void enqueue(const uint8_t* data, const size_t length) {
        Item item;
        item.kind = Kind::Payload;
        item.length = static_cast<uint8_t>(length < kMaxPayload ? length : kMaxPayload);
        memcpy(item.data, data, item.length);
        if (xQueueSendToBack(queue_, &item, 0) != pdTRUE) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Control items jump the queue. A full queue means the receiver has items
    // to take and rechecks the flags after each one.
    void post(const Kind kind) {
        Item item;
        item.kind = kind;
        item.length = 0;
        if (xQueueSendToFront(queue_, &item, 0) != pdTRUE) {
            CSCSYNC_LOG_TRACE("[BLE] Wakeup coalesced, queue full\n");
        }
    }

    C& central_;
    std::atomic<bool> linkLost_{false};
    std::atomic<uint32_t> dropped_{0};
    uint8_t queueStorage_[kQueueDepth * sizeof(Item)];
    StaticQueue_t queueBuffer_;
    QueueHandle_t queue_;
};

}  // namespace cscsync

#endif // CSCSYNC_MONITOR_HPP_
