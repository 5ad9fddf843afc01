/**
 * @file core.hpp
 * @brief Backend contracts - concepts checked wherever a backend is plugged in
 *
 * @details
 * The resolver, monitor and playback controller are templates over these
 * contracts. The firmware plugs in the NimBLE central and the mpv link; tests
 * plug in fakes.
 *
 * # Concepts
 * - **CentralBackend**: BLE central role (scan, connect, GATT discovery, notify).
 *   `connect()` only starts the attempt; the outcome arrives through `ConnectFn`
 * - **PlaybackSink**: video player command surface
 * - **SpeedSource** / **SpeedSink**: read and write sides of the speed controller
 */

#ifndef CSCSYNC_CORE_HPP_
#define CSCSYNC_CORE_HPP_

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace cscsync_core {

/// Advertisement seen while scanning; runs on the BLE host task
template<typename Peer>
using ScanFn = std::function<void(const Peer& peer, const std::string& address)>;

/// Notification payload; runs on the BLE host task and must not block
using NotifyFn = std::function<void(const uint8_t* data, size_t length)>;

/// Outcome of a connection attempt; runs on the BLE host task
using ConnectFn = std::function<void(bool connected)>;

/// Link dropped; receives the stack's reason code
using DisconnectFn = std::function<void(int reason)>;

template<typename C>
concept CentralBackend = requires(C central,
                                  const typename C::Peer& peer,
                                  typename C::Characteristic& chr,
                                  ScanFn<typename C::Peer> onScan,
                                  ConnectFn onConnect,
                                  NotifyFn onNotify,
                                  DisconnectFn onDisconnect,
                                  uint16_t uuid) {
    typename C::Peer;
    typename C::Characteristic;
    { central.startScan(onScan) } -> std::same_as<bool>;
    { central.stopScan() } -> std::same_as<bool>;
    { central.connect(peer, onConnect) } -> std::same_as<bool>;
    { central.cancelConnect() } -> std::same_as<bool>;
    { central.disconnect() } -> std::same_as<void>;
    { central.discoverService(uuid) } -> std::same_as<bool>;
    { central.discoverCharacteristic(uuid, uuid) } -> std::same_as<typename C::Characteristic*>;
    { central.subscribe(chr, onNotify) } -> std::same_as<bool>;
    { central.unsubscribe(chr) } -> std::same_as<bool>;
    { central.setDisconnectHandler(onDisconnect) } -> std::same_as<void>;
};

template<typename S>
concept PlaybackSink = requires(S sink, const char* text, float value, bool flag, uint32_t ms) {
    { sink.loadFile(text) } -> std::same_as<bool>;
    { sink.setSpeed(value) } -> std::same_as<bool>;
    { sink.setPaused(flag) } -> std::same_as<bool>;
    { sink.showText(text, ms) } -> std::same_as<bool>;
    { sink.setWindowScale(value) } -> std::same_as<bool>;
};

template<typename S>
concept SpeedSource = requires(const S& source) {
    { source.smoothedSpeed() } -> std::convertible_to<float>;
};

template<typename S>
concept SpeedSink = requires(S& sink, float speed) {
    sink.updateSpeed(speed);
};

}  // namespace cscsync_core

#endif // CSCSYNC_CORE_HPP_
