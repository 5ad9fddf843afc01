/**
 * @file signals.hpp
 * @brief Shutdown signals - operator requests that cancel the root context
 *
 * @details
 * A small task polls the serial console and an optional button:
 * - **Ctrl-C (0x03)**: SIGINT
 * - **Ctrl-D (0x04)**: SIGTERM
 * - **Button held low** for three polls: SIGINT
 *
 * The first signal cancels the watched context with ContextCancelled. The task
 * ends once that context is done or `stop()` is called.
 *
 * Complete console lines starting with `{` are handed to the line handler
 * (settings updates); other lines are ignored.
 */

#ifndef CSCSYNC_SIGNALS_HPP_
#define CSCSYNC_SIGNALS_HPP_

#include "context.hpp"

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

namespace cscsync {

enum class Signal : uint8_t {
    None,
    Interrupt,  ///< SIGINT equivalent
    Terminate   ///< SIGTERM equivalent
};

const char* signalName(Signal signal) noexcept;

struct SignalOptions {
    Stream* console = &Serial;   ///< nullptr disables console input
    int buttonPin = -1;          ///< Active-low button, -1 for none
    uint32_t pollMs = 50;
    uint32_t stackSize = 4096;
    UBaseType_t priority = 1;
};

class ShutdownSignals {
public:
    using LineHandler = std::function<void(const char* line)>;

    static constexpr uint8_t CTRL_C = 0x03;
    static constexpr uint8_t CTRL_D = 0x04;
    static constexpr size_t kMaxLine = 512;
    static constexpr uint8_t kButtonDebouncePolls = 3;

    explicit ShutdownSignals(const SignalOptions& options = SignalOptions{});
    ~ShutdownSignals();

    ShutdownSignals(const ShutdownSignals&) = delete;
    ShutdownSignals& operator=(const ShutdownSignals&) = delete;

    /**
     * @brief Start watching; a signal cancels ctx
     * @return false if already running or the task could not be created
     */
    [[nodiscard]] bool start(Context& ctx);

    /// Stop the watcher task and wait for it to exit
    void stop();

    /// First signal received, Signal::None if none
    [[nodiscard]] Signal received() const noexcept { return received_.load(std::memory_order_acquire); }

    void setLineHandler(LineHandler handler) { lineHandler_ = std::move(handler); }

    /**
     * @brief Process one console byte
     * @return The signal the byte stands for, Signal::None otherwise
     */
    Signal feed(uint8_t byte);

    /**
     * @brief Process one button sample (true = pressed)
     * @return Signal::Interrupt once the press has been held long enough
     */
    Signal sampleButton(bool pressed);

    /// Record the signal and cancel the watched context (first signal wins)
    void raise(Signal signal);

private:
    static void taskEntry(void* arg);
    void poll();

    SignalOptions options_;
    LineHandler lineHandler_;

    Context* ctx_ = nullptr;
    std::atomic<Signal> received_{Signal::None};
    std::atomic<bool> stopRequested_{false};
    TaskHandle_t task_ = nullptr;

    StaticSemaphore_t exitedBuffer_{};
    SemaphoreHandle_t exited_;

    char line_[kMaxLine]{};
    size_t lineLength_ = 0;
    bool lineOverflow_ = false;
    uint8_t buttonLowPolls_ = 0;
};

}  // namespace cscsync

#endif // CSCSYNC_SIGNALS_HPP_
