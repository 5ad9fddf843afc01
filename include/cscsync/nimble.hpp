/**
 * @file nimble.hpp
 * @brief NimBLE backend - BLE central role on NimBLE-Arduino
 *
 * @details
 * `NimbleCentral` satisfies `cscsync_core::CentralBackend` for one peripheral
 * link at a time.
 *
 * # Callback Context
 * - Scan results, connection outcomes and disconnects arrive on the NimBLE host task
 * - Notifications arrive on the NimBLE host task; the handler must not block
 *
 * The handlers are stored under a mutex so they can be replaced or cleared from
 * the calling task while the host task is delivering events.
 *
 * @note NimBLE-specific: Requires NimBLE-Arduino 2.x
 */

#ifndef CSCSYNC_NIMBLE_HPP_
#define CSCSYNC_NIMBLE_HPP_

#include "core.hpp"
#include "log.h"

#include <NimBLEDevice.h>

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

namespace cscsync_nimble {

class NimbleCentral {
public:
    using Peer = NimBLEAddress;
    using Characteristic = NimBLERemoteCharacteristic;

    struct Options {
        uint16_t scanIntervalMs = 100;
        uint16_t scanWindowMs = 99;
        bool activeScan = true;
        uint32_t connectTimeoutMs = 10000;
    };

    /**
     * @brief Bring the NimBLE stack up (first call only)
     * @return true once the stack is initialized
     */
    [[nodiscard]]
    static bool init(const char* deviceName) {
        static std::atomic_flag init_called = ATOMIC_FLAG_INIT;
        if (init_called.test_and_set(std::memory_order_acq_rel)) {
            CSCSYNC_LOG_WARN("[BLE] NimBLE already initialized, nothing to do\n");
            return NimBLEDevice::isInitialized();
        }
        CSCSYNC_LOG_TRACE("[BLE] init: calling NimBLEDevice::init\n");
        if (!NimBLEDevice::init(deviceName)) {
            CSCSYNC_LOG_ERROR("[BLE] NimBLE stack failed to initialize\n");
            return false;
        }
        CSCSYNC_LOG_INFO("[BLE] Created new BLE central controller (%s)\n",
                         NimBLEDevice::getAddress().toString().c_str());
        return true;
    }

    explicit NimbleCentral(const Options& options = Options{}) : options_(options) {}

    ~NimbleCentral() {
        stopScan();
        if (client_) {
            if (client_->isConnected()) {
                client_->disconnect();
            }
            NimBLEDevice::deleteClient(client_);
        }
    }

    NimbleCentral(const NimbleCentral&) = delete;
    NimbleCentral& operator=(const NimbleCentral&) = delete;

    // ---------------------- Scanning ----------------------

    bool startScan(cscsync_core::ScanFn<Peer> onResult) {
        NimBLEScan* scan = NimBLEDevice::getScan();
        scanCallbacks_.set(std::move(onResult));
        scan->setScanCallbacks(&scanCallbacks_, false);
        scan->setActiveScan(options_.activeScan);
        scan->setInterval(options_.scanIntervalMs);
        scan->setWindow(options_.scanWindowMs);
        if (!scan->start(0, false, true)) {
            scanCallbacks_.set(nullptr);
            return false;
        }
        return true;
    }

    /// Idempotent; also drops the scan handler
    bool stopScan() {
        scanCallbacks_.set(nullptr);
        NimBLEScan* scan = NimBLEDevice::getScan();
        if (!scan->isScanning()) {
            return true;
        }
        return scan->stop();
    }

    // ---------------------- Connection ----------------------

    /**
     * @brief Start an asynchronous connection attempt
     * @return false if the attempt could not be started (onResult is not called)
     * @note onResult runs once, on the host task, unless cancelConnect() wins
     */
    bool connect(const Peer& peer, cscsync_core::ConnectFn onResult) {
        if (!client_) {
            client_ = NimBLEDevice::createClient();
            if (!client_) {
                CSCSYNC_LOG_ERROR("[BLE] Could not allocate a client\n");
                return false;
            }
            client_->setClientCallbacks(&clientCallbacks_, false);
        }
        client_->setConnectTimeout(options_.connectTimeoutMs);
        service_ = nullptr;
        clientCallbacks_.setConnect(std::move(onResult));
        if (!client_->connect(peer, true, true, true)) {
            clientCallbacks_.setConnect(nullptr);
            return false;
        }
        return true;
    }

    /// Abort a pending attempt; its outcome is no longer reported
    bool cancelConnect() {
        clientCallbacks_.setConnect(nullptr);
        if (!client_ || client_->isConnected()) {
            return true;
        }
        return client_->cancelConnect();
    }

    void disconnect() {
        service_ = nullptr;
        if (client_ && client_->isConnected()) {
            client_->disconnect();
        }
    }

    void setDisconnectHandler(cscsync_core::DisconnectFn onDisconnect) {
        clientCallbacks_.set(std::move(onDisconnect));
    }

    // ---------------------- GATT ----------------------

    bool discoverService(const uint16_t uuid) {
        if (!client_ || !client_->isConnected()) {
            return false;
        }
        service_ = client_->getService(NimBLEUUID(uuid));
        return service_ != nullptr;
    }

    Characteristic* discoverCharacteristic(const uint16_t serviceUuid, const uint16_t characteristicUuid) {
        if (!service_ || service_->getUUID() != NimBLEUUID(serviceUuid)) {
            if (!discoverService(serviceUuid)) {
                return nullptr;
            }
        }
        return service_->getCharacteristic(NimBLEUUID(characteristicUuid));
    }

    bool subscribe(Characteristic& chr, cscsync_core::NotifyFn onNotify) {
        if (!chr.canNotify()) {
            CSCSYNC_LOG_WARN("[BLE] Characteristic %s does not support notify\n",
                             chr.getUUID().toString().c_str());
            return false;
        }
        return chr.subscribe(true,
            [fn = std::move(onNotify)](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
                fn(data, length);
            }, true);
    }

    bool unsubscribe(Characteristic& chr) {
        if (!client_ || !client_->isConnected()) {
            return false;
        }
        return chr.unsubscribe(true);
    }

private:
    struct ScanCallbacks final : NimBLEScanCallbacks {
        void set(cscsync_core::ScanFn<Peer> fn) {
            std::lock_guard<std::mutex> lock(mutex);
            handler = std::move(fn);
        }

        // The handler may stop the scan, so it runs on a copy outside the lock
        void onResult(const NimBLEAdvertisedDevice* device) override {
            cscsync_core::ScanFn<Peer> fn;
            {
                std::lock_guard<std::mutex> lock(mutex);
                fn = handler;
            }
            if (fn) {
                fn(device->getAddress(), device->getAddress().toString());
            }
        }

        void onScanEnd(const NimBLEScanResults& results, const int reason) override {
            CSCSYNC_LOG_DEBUG("[BLE] Scan ended (reason=%d, %d devices)\n", reason, results.getCount());
        }

        std::mutex mutex;
        cscsync_core::ScanFn<Peer> handler;
    };

    struct ClientCallbacks final : NimBLEClientCallbacks {
        void set(cscsync_core::DisconnectFn fn) {
            std::lock_guard<std::mutex> lock(mutex);
            handler = std::move(fn);
        }

        void setConnect(cscsync_core::ConnectFn fn) {
            std::lock_guard<std::mutex> lock(mutex);
            connectHandler = std::move(fn);
        }

        void onConnect(NimBLEClient* client) override {
            CSCSYNC_LOG_DEBUG("[BLE] Link up: %s\n", client->getPeerAddress().toString().c_str());
            reportConnect(true);
        }

        void onConnectFail([[maybe_unused]] NimBLEClient* client, const int reason) override {
            CSCSYNC_LOG_WARN("[BLE] Connection attempt failed (reason=%d)\n", reason);
            reportConnect(false);
        }

        // One outcome per attempt: the handler is taken, not copied
        void reportConnect(const bool connected) {
            cscsync_core::ConnectFn fn;
            {
                std::lock_guard<std::mutex> lock(mutex);
                fn = std::move(connectHandler);
                connectHandler = nullptr;
            }
            if (fn) {
                fn(connected);
            }
        }

        void onDisconnect([[maybe_unused]] NimBLEClient* client, const int reason) override {
            CSCSYNC_LOG_INFO("[BLE] Disconnected (reason=%d)\n", reason);
            cscsync_core::DisconnectFn fn;
            {
                std::lock_guard<std::mutex> lock(mutex);
                fn = handler;
            }
            if (fn) {
                fn(reason);
            }
        }

        std::mutex mutex;
        cscsync_core::DisconnectFn handler;
        cscsync_core::ConnectFn connectHandler;
    };

    Options options_;
    ScanCallbacks scanCallbacks_;
    ClientCallbacks clientCallbacks_;
    NimBLEClient* client_ = nullptr;
    NimBLERemoteService* service_ = nullptr;
};

static_assert(cscsync_core::CentralBackend<NimbleCentral>);

}  // namespace cscsync_nimble

#endif // CSCSYNC_NIMBLE_HPP_
