#include "cscsync/context.hpp"
#include "cscsync/log.h"

namespace cscsync {

namespace {
    TickType_t msToTicks(const uint32_t ms) {
        const uint64_t ticks = (static_cast<uint64_t>(ms) * configTICK_RATE_HZ + 999) / 1000;
        return ticks >= portMAX_DELAY ? portMAX_DELAY - 1 : static_cast<TickType_t>(ticks);
    }

    uint32_t ticksToMs(const TickType_t ticks) {
        return static_cast<uint32_t>(static_cast<uint64_t>(ticks) * 1000 / configTICK_RATE_HZ);
    }

    // Wrap-safe: the tick counter rolls over
    bool tickReached(const TickType_t now, const TickType_t deadline) {
        return static_cast<int32_t>(deadline - now) <= 0;
    }
}

Context::Context() : events_(xEventGroupCreateStatic(&eventsBuffer_)) {
    configASSERT(events_ != nullptr);
}

Context::Context(Context& parent) : Context() {
    parent_ = &parent;
    {
        std::lock_guard<std::recursive_mutex> lock(parent.mutex_);
        hasDeadline_ = parent.hasDeadline_;
        deadline_ = parent.deadline_;
    }
    link_.self = this;
    parent.addListener(link_);
}

Context::Context(Context& parent, const uint32_t timeoutMs) : Context() {
    parent_ = &parent;
    const TickType_t own = xTaskGetTickCount() + msToTicks(timeoutMs);
    {
        std::lock_guard<std::recursive_mutex> lock(parent.mutex_);
        if (parent.hasDeadline_ && !tickReached(parent.deadline_, own)) {
            deadline_ = parent.deadline_;
        } else {
            deadline_ = own;
        }
        hasDeadline_ = true;
    }
    link_.self = this;
    parent.addListener(link_);
}

Context::~Context() {
    if (parent_) {
        parent_->removeListener(link_);
    }
    vEventGroupDelete(events_);
}

void Context::cancel(const Error reason) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    completeLocked(reason);
}

void Context::completeLocked(const Error reason) {
    if (done_) {
        return;
    }
    done_ = true;
    err_ = reason == Error::None ? Error::ContextCancelled : reason;
    xEventGroupSetBits(events_, DONE_BIT);
    CSCSYNC_LOG_TRACE("[APP] Context %p done: %s\n", static_cast<void*>(this), toString(err_));

    Listener* listener = listeners_;
    listeners_ = nullptr;
    while (listener) {
        Listener* next = listener->next_;
        listener->next_ = nullptr;
        listener->onContextDone(err_);
        listener = next;
    }
}

bool Context::observeDeadlineLocked() {
    if (!done_ && hasDeadline_ && tickReached(xTaskGetTickCount(), deadline_)) {
        completeLocked(Error::DeadlineExceeded);
    }
    return done_;
}

bool Context::isDone() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return observeDeadlineLocked();
}

Error Context::err() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    observeDeadlineLocked();
    return err_;
}

bool Context::wait(const uint32_t timeoutMs) {
    TickType_t waitTicks = timeoutMs == kWaitForever ? portMAX_DELAY : msToTicks(timeoutMs);
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (observeDeadlineLocked()) {
            return true;
        }
        if (hasDeadline_) {
            const TickType_t left = deadline_ - xTaskGetTickCount();
            if (left < waitTicks) {
                waitTicks = left;
            }
        }
    }

    const EventBits_t bits = xEventGroupWaitBits(events_, DONE_BIT, pdFALSE, pdTRUE, waitTicks);
    if (bits & DONE_BIT) {
        return true;
    }
    return isDone();
}

uint32_t Context::remainingMs() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (observeDeadlineLocked()) {
        return 0;
    }
    if (!hasDeadline_) {
        return kWaitForever;
    }
    return ticksToMs(deadline_ - xTaskGetTickCount());
}

void Context::addListener(Listener& listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (observeDeadlineLocked()) {
        listener.onContextDone(err_);
        return;
    }
    listener.next_ = listeners_;
    listeners_ = &listener;
}

void Context::removeListener(Listener& listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (Listener** cursor = &listeners_; *cursor; cursor = &(*cursor)->next_) {
        if (*cursor == &listener) {
            *cursor = listener.next_;
            listener.next_ = nullptr;
            return;
        }
    }
}

}  // namespace cscsync
