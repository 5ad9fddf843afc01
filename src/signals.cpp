#include "cscsync/signals.hpp"
#include "cscsync/log.h"

namespace cscsync {

const char* signalName(const Signal signal) noexcept {
    switch (signal) {
        case Signal::None:      return "none";
        case Signal::Interrupt: return "SIGINT";
        case Signal::Terminate: return "SIGTERM";
    }
    return "unknown";
}

ShutdownSignals::ShutdownSignals(const SignalOptions& options)
    : options_(options), exited_(xSemaphoreCreateBinaryStatic(&exitedBuffer_)) {
    configASSERT(exited_ != nullptr);
}

ShutdownSignals::~ShutdownSignals() {
    stop();
    vSemaphoreDelete(exited_);
}

bool ShutdownSignals::start(Context& ctx) {
    if (task_) {
        CSCSYNC_LOG_WARN("[APP] Signal watcher already running\n");
        return false;
    }
    ctx_ = &ctx;
    received_.store(Signal::None, std::memory_order_release);
    stopRequested_.store(false, std::memory_order_release);
    lineLength_ = 0;
    lineOverflow_ = false;
    buttonLowPolls_ = 0;

    if (options_.buttonPin >= 0) {
        pinMode(options_.buttonPin, INPUT_PULLUP);
    }

    if (xTaskCreate(taskEntry, "signals", options_.stackSize, this, options_.priority, &task_) != pdPASS) {
        CSCSYNC_LOG_ERROR("[APP] Could not start signal watcher\n");
        task_ = nullptr;
        ctx_ = nullptr;
        return false;
    }
    CSCSYNC_LOG_DEBUG("[APP] Watching for Ctrl-C / Ctrl-D%s\n", options_.buttonPin >= 0 ? " and button" : "");
    return true;
}

void ShutdownSignals::stop() {
    if (!task_) {
        return;
    }
    stopRequested_.store(true, std::memory_order_release);
    xSemaphoreTake(exited_, portMAX_DELAY);
    task_ = nullptr;
    ctx_ = nullptr;
}

void ShutdownSignals::taskEntry(void* arg) {
    auto* self = static_cast<ShutdownSignals*>(arg);
    while (!self->stopRequested_.load(std::memory_order_acquire) && !self->ctx_->wait(self->options_.pollMs)) {
        self->poll();
    }
    xSemaphoreGive(self->exited_);
    vTaskDelete(nullptr);
}

void ShutdownSignals::poll() {
    if (options_.console) {
        while (options_.console->available() > 0) {
            const int c = options_.console->read();
            if (c < 0) {
                break;
            }
            const Signal signal = feed(static_cast<uint8_t>(c));
            if (signal != Signal::None) {
                raise(signal);
            }
        }
    }
    if (options_.buttonPin >= 0) {
        const Signal signal = sampleButton(digitalRead(options_.buttonPin) == LOW);
        if (signal != Signal::None) {
            raise(signal);
        }
    }
}

Signal ShutdownSignals::feed(const uint8_t byte) {
    switch (byte) {
        case CTRL_C:
            return Signal::Interrupt;
        case CTRL_D:
            return Signal::Terminate;
        case '\r':
        case '\n':
            if (lineOverflow_) {
                CSCSYNC_LOG_WARN("[CFG] Console line longer than %u bytes ignored\n", static_cast<unsigned>(kMaxLine - 1));
            } else if (lineLength_ > 0 && line_[0] == '{' && lineHandler_) {
                line_[lineLength_] = '\0';
                lineHandler_(line_);
            }
            lineLength_ = 0;
            lineOverflow_ = false;
            return Signal::None;
        default:
            if (lineLength_ < kMaxLine - 1) {
                line_[lineLength_++] = static_cast<char>(byte);
            } else {
                lineOverflow_ = true;
            }
            return Signal::None;
    }
}

Signal ShutdownSignals::sampleButton(const bool pressed) {
    if (!pressed) {
        buttonLowPolls_ = 0;
        return Signal::None;
    }
    if (buttonLowPolls_ < kButtonDebouncePolls) {
        ++buttonLowPolls_;
        if (buttonLowPolls_ == kButtonDebouncePolls) {
            return Signal::Interrupt;
        }
    }
    return Signal::None;
}

void ShutdownSignals::raise(const Signal signal) {
    Signal expected = Signal::None;
    if (signal == Signal::None || !received_.compare_exchange_strong(expected, signal, std::memory_order_acq_rel)) {
        return;
    }
    CSCSYNC_LOG_INFO("[APP] Received %s, shutting down...\n", signalName(signal));
    if (ctx_) {
        ctx_->cancel(Error::ContextCancelled);
    }
}

}  // namespace cscsync
