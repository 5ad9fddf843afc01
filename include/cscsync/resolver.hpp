/**
 * @file resolver.hpp
 * @brief Peripheral resolution - scan, connect, and locate the CSC measurement
 *
 * @details
 * Runs once at startup on the orchestrator's task. Every failure is terminal
 * for the run; nothing is retried here.
 *
 * # Sequence
 * 1. Scan until the configured address advertises, bounded by a deadline child
 *    of the caller's context
 * 2. Connect to the matched peer; the attempt is cancelled if the caller's
 *    context completes first
 * 3. Discover the CSC service (0x1816)
 * 4. Discover the CSC Measurement characteristic (0x2A5B)
 *
 * The characteristic stays owned by the central's connection.
 */

#ifndef CSCSYNC_RESOLVER_HPP_
#define CSCSYNC_RESOLVER_HPP_

#include "context.hpp"
#include "core.hpp"
#include "csc.hpp"
#include "error.hpp"
#include "log.h"

#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

#include <atomic>
#include <memory>
#include <string>
#include <strings.h>

namespace cscsync {

struct ResolverOptions {
    const char* sensorAddress = nullptr;  ///< "aa:bb:cc:dd:ee:ff", any case
    uint32_t scanTimeoutSeconds = 30;
};

template<cscsync_core::CentralBackend C>
class PeripheralResolver {
public:
    using Peer = typename C::Peer;
    using Characteristic = typename C::Characteristic;

    explicit PeripheralResolver(C& central) : central_(central) {}

    /**
     * @brief Locate the CSC Measurement characteristic of the configured sensor
     * @param[out] out Characteristic on success, nullptr otherwise
     * @return Error::None, or the phase that failed (ContextCancelled if ctx completed)
     */
    [[nodiscard]] Error resolve(Context& ctx, const ResolverOptions& options, Characteristic*& out) {
        out = nullptr;

        auto session = std::make_shared<Session>(options.sensorAddress);
        const Error scanError = scan(ctx, options, session);
        if (scanError != Error::None) {
            return scanError;
        }

        const Error connectError = connect(ctx, options, session);
        if (connectError != Error::None) {
            return connectError;
        }
        CSCSYNC_LOG_INFO("[BLE] BLE peripheral device connected\n");

        CSCSYNC_LOG_INFO("[BLE] Discovering CSC services 0x%04X\n", csc::SERVICE_UUID);
        if (!central_.discoverService(csc::SERVICE_UUID)) {
            CSCSYNC_LOG_WARN("[BLE] CSC services discovery failed\n");
            central_.disconnect();
            return Error::ServiceNotFound;
        }
        if (ctx.isDone()) {
            central_.disconnect();
            return Error::ContextCancelled;
        }
        CSCSYNC_LOG_INFO("[BLE] Found CSC service 0x%04X\n", csc::SERVICE_UUID);

        CSCSYNC_LOG_INFO("[BLE] Discovering CSC characteristics 0x%04X\n", csc::MEASUREMENT_UUID);
        Characteristic* chr = central_.discoverCharacteristic(csc::SERVICE_UUID, csc::MEASUREMENT_UUID);
        if (!chr) {
            CSCSYNC_LOG_WARN("[BLE] CSC characteristics discovery failed\n");
            central_.disconnect();
            return Error::CharacteristicNotFound;
        }
        if (ctx.isDone()) {
            central_.disconnect();
            return Error::ContextCancelled;
        }
        CSCSYNC_LOG_INFO("[BLE] Found CSC characteristic 0x%04X\n", csc::MEASUREMENT_UUID);

        out = chr;
        return Error::None;
    }

private:
    // Shared with the host-task callbacks, which may still run after
    // resolve() returned
    struct Session final : Context::Listener {
        static constexpr EventBits_t FOUND_BIT = BIT0;
        static constexpr EventBits_t DONE_BIT = BIT1;
        static constexpr EventBits_t CONNECTED_BIT = BIT2;
        static constexpr EventBits_t CONNECT_FAILED_BIT = BIT3;

        explicit Session(const char* address)
            : target(address ? address : ""), events(xEventGroupCreateStatic(&eventsBuffer)) {
            configASSERT(events != nullptr);
        }

        ~Session() { vEventGroupDelete(events); }

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        void onContextDone(Error) override { xEventGroupSetBits(events, DONE_BIT); }

        const std::string target;
        std::atomic<bool> matched{false};
        Peer peer{};
        StaticEventGroup_t eventsBuffer{};
        EventGroupHandle_t events;
    };

    Error scan(Context& ctx, const ResolverOptions& options, const std::shared_ptr<Session>& shared) {
        Session& session = *shared;
        Context scanCtx(ctx, options.scanTimeoutSeconds * 1000);
        scanCtx.addListener(session);

        CSCSYNC_LOG_INFO("[BLE] Now scanning the ether for BLE peripheral %s...\n", options.sensorAddress);

        C* central = &central_;
        const bool started = central_.startScan([central, shared](const Peer& peer, const std::string& address) {
            if (strcasecmp(address.c_str(), shared->target.c_str()) != 0) {
                return;
            }
            if (shared->matched.exchange(true)) {
                return;
            }
            shared->peer = peer;
            if (!central->stopScan()) {
                CSCSYNC_LOG_WARN("[BLE] Failed to stop scan\n");
            }
            xEventGroupSetBits(shared->events, Session::FOUND_BIT);
        });
        if (!started) {
            CSCSYNC_LOG_ERROR("[BLE] Scan could not be started\n");
            scanCtx.removeListener(session);
            return Error::ScanFailed;
        }

        for (;;) {
            const uint32_t waitMs = scanCtx.remainingMs();
            const EventBits_t bits = xEventGroupWaitBits(session.events,
                                                         Session::FOUND_BIT | Session::DONE_BIT,
                                                         pdFALSE, pdFALSE, pdMS_TO_TICKS(waitMs));
            if (bits & Session::FOUND_BIT) {
                break;
            }
            if (ctx.isDone()) {
                stopScanOrWarn();
                scanCtx.removeListener(session);
                return Error::ContextCancelled;
            }
            if (scanCtx.isDone()) {
                stopScanOrWarn();
                scanCtx.removeListener(session);
                CSCSYNC_LOG_ERROR("[BLE] %s\n", toString(Error::ScanTimeout));
                return Error::ScanTimeout;
            }
        }

        scanCtx.removeListener(session);
        CSCSYNC_LOG_INFO("[BLE] Found BLE peripheral %s\n", session.target.c_str());
        return Error::None;
    }

    // Waits for the connection outcome or the caller's context, whichever is first
    Error connect(Context& ctx, const ResolverOptions& options, const std::shared_ptr<Session>& session) {
        xEventGroupClearBits(session->events, Session::DONE_BIT);

        CSCSYNC_LOG_INFO("[BLE] Connecting to BLE peripheral device %s\n", options.sensorAddress);
        std::weak_ptr<Session> weak = session;
        const bool started = central_.connect(session->peer, [weak](const bool connected) {
            if (auto s = weak.lock()) {
                xEventGroupSetBits(s->events, connected ? Session::CONNECTED_BIT : Session::CONNECT_FAILED_BIT);
            }
        });
        if (!started) {
            CSCSYNC_LOG_ERROR("[BLE] Connection to %s could not be started\n", options.sensorAddress);
            return Error::ConnectionFailed;
        }

        ctx.addListener(*session);
        const EventBits_t bits = xEventGroupWaitBits(session->events,
                                                     Session::CONNECTED_BIT | Session::CONNECT_FAILED_BIT |
                                                         Session::DONE_BIT,
                                                     pdFALSE, pdFALSE, portMAX_DELAY);
        ctx.removeListener(*session);

        if (bits & Session::CONNECTED_BIT) {
            if (ctx.isDone()) {
                central_.disconnect();
                return Error::ContextCancelled;
            }
            return Error::None;
        }
        if (bits & Session::CONNECT_FAILED_BIT) {
            CSCSYNC_LOG_ERROR("[BLE] Connection to %s failed\n", options.sensorAddress);
            return Error::ConnectionFailed;
        }

        CSCSYNC_LOG_INFO("[BLE] Connection attempt abandoned\n");
        if (!central_.cancelConnect()) {
            CSCSYNC_LOG_WARN("[BLE] Failed to cancel connection attempt\n");
        }
        central_.disconnect();
        return Error::ContextCancelled;
    }

    void stopScanOrWarn() {
        if (!central_.stopScan()) {
            CSCSYNC_LOG_WARN("[BLE] Failed to stop scan\n");
        }
    }

    C& central_;
};

}  // namespace cscsync

#endif // CSCSYNC_RESOLVER_HPP_
