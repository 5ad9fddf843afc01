/**
 * @file context.hpp
 * @brief Cancellation context tree shared by the orchestrator and its activities
 *
 * @details
 * A `Context` carries one completion flag and the reason it completed. Children
 * are cancelled together with their parent; a deadline child also completes by
 * itself once its deadline passes. Deadlines are observed lazily by `isDone()`,
 * `err()`, `wait()` and `remainingMs()`, so no timer task is involved.
 *
 * # Lifetime
 * - Contexts live on the stack of the task that created them
 * - A child MUST be destroyed before its parent
 *
 * # Listeners
 * Listeners run on the task that cancels the context, with the context locked.
 * They must not block; posting to a queue or setting an event bit is fine.
 *
 * @code
 * Context root;
 * Context scan(root, 30000);
 * while (!scan.wait(100)) { ... }
 * if (scan.err() == Error::DeadlineExceeded) { ... }
 * @endcode
 */

#ifndef CSCSYNC_CONTEXT_HPP_
#define CSCSYNC_CONTEXT_HPP_

#include "error.hpp"

#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>

#include <cstdint>
#include <mutex>

namespace cscsync {

class Context {
public:
    /// Completion hook; intrusive, so registering never allocates
    class Listener {
    public:
        virtual void onContextDone(Error reason) = 0;

    protected:
        ~Listener() = default;

    private:
        friend class Context;
        Listener* next_ = nullptr;
    };

    static constexpr uint32_t kWaitForever = UINT32_MAX;

    /// Root context: completes only through cancel()
    Context();

    /// Child context: completes with its parent
    explicit Context(Context& parent);

    /// Deadline child: also completes with DeadlineExceeded after timeoutMs
    Context(Context& parent, uint32_t timeoutMs);

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /**
     * @brief Complete the context and every descendant
     * @note Idempotent: the first reason is kept
     */
    void cancel(Error reason = Error::ContextCancelled);

    [[nodiscard]] bool isDone();

    /// Reason the context completed, Error::None while still running
    [[nodiscard]] Error err();

    /**
     * @brief Block until the context completes or timeoutMs elapses
     * @return true if the context is done
     * @note Never sleeps past the context's deadline
     */
    bool wait(uint32_t timeoutMs);

    /// Milliseconds until the deadline, kWaitForever without one
    [[nodiscard]] uint32_t remainingMs();

    /// Register a listener; fires immediately if the context is already done
    void addListener(Listener& listener);

    void removeListener(Listener& listener);

private:
    struct ParentLink final : Listener {
        Context* self = nullptr;
        void onContextDone(const Error reason) override { self->cancel(reason); }
    };

    static constexpr EventBits_t DONE_BIT = BIT0;

    void completeLocked(Error reason);
    bool observeDeadlineLocked();

    Context* parent_ = nullptr;
    ParentLink link_;

    bool hasDeadline_ = false;
    TickType_t deadline_ = 0;

    bool done_ = false;
    Error err_ = Error::None;
    Listener* listeners_ = nullptr;

    std::recursive_mutex mutex_;
    StaticEventGroup_t eventsBuffer_{};
    EventGroupHandle_t events_ = nullptr;
};

}  // namespace cscsync

#endif // CSCSYNC_CONTEXT_HPP_
