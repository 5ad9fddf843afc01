#include "cscsync/orchestrator.hpp"
#include "cscsync/log.h"

#include <utility>

namespace cscsync {

const char* componentTag(const Component component) noexcept {
    switch (component) {
        case Component::App:   return "APP";
        case Component::Ble:   return "BLE";
        case Component::Speed: return "SPEED";
        case Component::Video: return "VIDEO";
    }
    return "APP";
}

const char* stateName(const Orchestrator::State state) noexcept {
    switch (state) {
        case Orchestrator::State::Idle:         return "idle";
        case Orchestrator::State::Resolving:    return "resolving";
        case Orchestrator::State::Running:      return "running";
        case Orchestrator::State::ShuttingDown: return "shutting down";
        case Orchestrator::State::Terminated:   return "terminated";
    }
    return "unknown";
}

Orchestrator::Orchestrator(ResolveStep resolve, Activity monitor, Activity playback,
                           const OrchestratorOptions& options)
    : resolve_(std::move(resolve)),
      activities_{std::move(monitor), std::move(playback)},
      options_(options),
      queue_(xQueueCreateStatic(kQueueDepth, sizeof(Completion), queueStorage_, &queueBuffer_)) {
    configASSERT(queue_ != nullptr);
}

Orchestrator::~Orchestrator() {
    vQueueDelete(queue_);
}

void Orchestrator::RootWatch::onContextDone(Error) {
    const Completion item{kContextSlot, Error::None};
    if (xQueueSendToBack(owner.queue_, &item, 0) != pdTRUE) {
        CSCSYNC_LOG_TRACE("[APP] Fan-in full, context wakeup coalesced\n");
    }
}

void Orchestrator::setState(const State next) {
    CSCSYNC_LOG_DEBUG("[APP] %s -> %s\n", stateName(state()), stateName(next));
    state_.store(next, std::memory_order_release);
}

void Orchestrator::taskEntry(void* arg) {
    const Launch* launch = static_cast<const Launch*>(arg);
    Orchestrator& self = *launch->self;
    const uint8_t slot = launch->slot;

    const Error error = self.activities_[slot].body(*launch->ctx);

    const Completion item{slot, error};
    xQueueSendToBack(self.queue_, &item, portMAX_DELAY);
    vTaskDelete(nullptr);
}

void Orchestrator::spawn(Launch& launch) {
    const Activity& activity = activities_[launch.slot];
    if (xTaskCreate(taskEntry, activity.name, options_.stackSize, &launch, options_.priority, nullptr) == pdPASS) {
        CSCSYNC_LOG_DEBUG("[%s] Started %s task\n", componentTag(activity.component), activity.name);
        return;
    }
    const Completion item{launch.slot, Error::TaskStartFailed};
    if (xQueueSendToBack(queue_, &item, 0) != pdTRUE) {
        CSCSYNC_LOG_ERROR("[APP] Fan-in rejected start failure of %s\n", activity.name);
    }
}

Error Orchestrator::run(Context& root) {
    xQueueReset(queue_);
    failed_ = Component::App;

    Context runCtx(root);

    setState(State::Resolving);
    const Error resolveError = resolve_(runCtx);
    if (resolveError != Error::None) {
        if (isCancellation(resolveError)) {
            CSCSYNC_LOG_INFO("[APP] Shutdown requested while resolving the BLE peripheral\n");
        } else {
            failed_ = Component::Ble;
            CSCSYNC_LOG_ERROR("[BLE] BLE peripheral scan failed: %s\n", toString(resolveError));
        }
        setState(State::Terminated);
        return resolveError;
    }

    setState(State::Running);
    RootWatch watch(*this);
    runCtx.addListener(watch);

    Launch launches[kActivityCount];
    for (uint8_t i = 0; i < kActivityCount; ++i) {
        launches[i] = Launch{this, i, &runCtx};
        spawn(launches[i]);
    }

    Error result = Error::None;
    bool decided = false;
    size_t reported = 0;

    while (reported < kActivityCount) {
        Completion item;
        const TickType_t wait = decided ? pdMS_TO_TICKS(options_.shutdownWarnMs) : portMAX_DELAY;
        if (xQueueReceive(queue_, &item, wait) != pdTRUE) {
            CSCSYNC_LOG_WARN("[APP] Still waiting for %u activities to stop\n",
                             static_cast<unsigned>(kActivityCount - reported));
            continue;
        }

        if (item.slot == kContextSlot) {
            if (!decided) {
                decided = true;
                CSCSYNC_LOG_INFO("[APP] Shutdown requested (%s)\n", toString(runCtx.err()));
                setState(State::ShuttingDown);
            }
            continue;
        }

        ++reported;
        const Activity& activity = activities_[item.slot];
        const char* tag = componentTag(activity.component);

        if (decided) {
            CSCSYNC_LOG_DEBUG("[%s] %s stopped: %s\n", tag, activity.name, toString(item.error));
            continue;
        }

        decided = true;
        if (item.error != Error::None && !isCancellation(item.error)) {
            result = item.error;
            failed_ = activity.component;
            CSCSYNC_LOG_ERROR("[%s] %s failed: %s\n", tag, activity.name, toString(item.error));
        } else {
            CSCSYNC_LOG_INFO("[%s] %s finished\n", tag, activity.name);
        }
        setState(State::ShuttingDown);
        runCtx.cancel();
    }

    runCtx.removeListener(watch);
    setState(State::Terminated);
    return result;
}

}  // namespace cscsync
