/**
 * @file cscsync.hpp
 * @brief Cycling speed to video playback rate, on an ESP32 BLE central
 *
 * @details
 * Finds one BLE Cycling Speed and Cadence sensor, decodes its wheel
 * revolution notifications into a smoothed speed, and keeps an mpv player
 * running at a matching rate.
 *
 * # Architecture
 * - **Runtime**: cancellation contexts and the orchestrator (context.hpp, orchestrator.hpp)
 * - **Pipeline**: resolver, monitor, decoder, speed controller, playback
 * - **Backends**: NimBLE central (nimble.hpp) and mpv JSON IPC (mpv_link.hpp)
 * - **Ambient**: logging (log.h), settings (settings.h), signals (signals.hpp)
 *
 * # Tasks
 * - NimBLE host task: scan results, notifications, disconnects (hand-off only)
 * - Caller task: resolution, then waits on the orchestrator fan-in
 * - Monitor task: decode and update speed
 * - Playback task: periodic player commands
 * - Signal task: console and button watcher
 *
 * @code{.cpp}
 * cscsync::Context root;
 * cscsync_nimble::NimbleCentral central;
 * cscsync::SpeedController<> speed(settings.smoothing_window);
 * cscsync::Orchestrator orchestrator(resolveStep, monitorActivity, playbackActivity);
 * const cscsync::Error error = orchestrator.run(root);
 * @endcode
 */

#ifndef CSCSYNC_HPP_
#define CSCSYNC_HPP_

#include "cscsync/error.hpp"
#include "cscsync/log.h"
#include "cscsync/platform.hpp"
#include "cscsync/context.hpp"
#include "cscsync/csc.hpp"
#include "cscsync/speed_controller.hpp"
#include "cscsync/core.hpp"
#include "cscsync/resolver.hpp"
#include "cscsync/monitor.hpp"
#include "cscsync/playback.hpp"
#include "cscsync/mpv_link.hpp"
#include "cscsync/orchestrator.hpp"
#include "cscsync/signals.hpp"
#include "cscsync/settings.h"

#ifdef NIMBLE_CPP_DEVICE_H_
    #include "cscsync/nimble.hpp"
#endif

#endif // CSCSYNC_HPP_
