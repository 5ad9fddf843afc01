/**
 * @file orchestrator.hpp
 * @brief Run orchestration - resolve once, then run the activities concurrently
 *
 * @details
 * # States
 * `Idle -> Resolving -> Running -> ShuttingDown -> Terminated`
 *
 * - **Resolving**: the resolve step runs on the calling task; a failure ends the
 *   run before any activity starts
 * - **Running**: each activity runs in its own FreeRTOS task, all sharing one
 *   child context of the root
 * - **ShuttingDown**: entered on the first fan-in item (root cancelled or an
 *   activity finished); the shared context is cancelled and the remaining
 *   activities are awaited
 *
 * # Result
 * The first fan-in item decides: an activity error other than a cancellation
 * reason is the result; root cancellation or a clean finish give Error::None.
 * Later completions are drained and logged, never acted upon.
 */

#ifndef CSCSYNC_ORCHESTRATOR_HPP_
#define CSCSYNC_ORCHESTRATOR_HPP_

#include "context.hpp"
#include "error.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

#include <atomic>
#include <cstdint>
#include <functional>

namespace cscsync {

enum class Component : uint8_t {
    App,
    Ble,
    Speed,
    Video
};

/// Log tag for a component ("APP", "BLE", "SPEED", "VIDEO")
const char* componentTag(Component component) noexcept;

struct Activity {
    const char* name;
    Component component;
    std::function<Error(Context&)> body;
};

using ResolveStep = std::function<Error(Context&)>;

struct OrchestratorOptions {
    uint32_t stackSize = 6144;
    UBaseType_t priority = 2;
    uint32_t shutdownWarnMs = 5000;  ///< Warn while activities take longer to stop
};

class Orchestrator {
public:
    enum class State : uint8_t {
        Idle,
        Resolving,
        Running,
        ShuttingDown,
        Terminated
    };

    static constexpr size_t kActivityCount = 2;

    Orchestrator(ResolveStep resolve, Activity monitor, Activity playback,
                 const OrchestratorOptions& options = OrchestratorOptions{});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Resolve, run both activities, and wait until every one has stopped
     * @return Resolve error, the first activity error, or Error::None
     * @note Blocks the calling task for the whole run
     */
    [[nodiscard]] Error run(Context& root);

    [[nodiscard]] State state() const noexcept { return state_.load(std::memory_order_acquire); }

    /// Component behind the returned error (App when none failed)
    [[nodiscard]] Component failedComponent() const noexcept { return failed_; }

private:
    static constexpr uint8_t kContextSlot = 0xFF;
    static constexpr size_t kQueueDepth = kActivityCount + 2;

    struct Completion {
        uint8_t slot;
        Error error;
    };

    struct Launch {
        Orchestrator* self;
        uint8_t slot;
        Context* ctx;
    };

    struct RootWatch final : Context::Listener {
        explicit RootWatch(Orchestrator& o) : owner(o) {}
        void onContextDone(Error reason) override;
        Orchestrator& owner;
    };

    static void taskEntry(void* arg);

    void spawn(Launch& launch);
    void setState(State next);

    ResolveStep resolve_;
    Activity activities_[kActivityCount];
    OrchestratorOptions options_;

    std::atomic<State> state_{State::Idle};
    Component failed_ = Component::App;

    uint8_t queueStorage_[kQueueDepth * sizeof(Completion)];
    StaticQueue_t queueBuffer_;
    QueueHandle_t queue_;
};

const char* stateName(Orchestrator::State state) noexcept;

}  // namespace cscsync

#endif // CSCSYNC_ORCHESTRATOR_HPP_
