/**
 * @file platform.hpp
 * @brief Platform layer - policy-based synchronization for shared pipeline state
 *
 * @details
 * Lock policies used by state shared between tasks (the speed controller's
 * window). Selection is compile-time, so single-task builds pay nothing.
 *
 * # Lock Policies
 * - **NoLock**: Zero-overhead no-op for single-task or externally synchronized use
 * - **FreeRTOSLock**: Instance-owned recursive mutex in static storage (no heap)
 * - **DefaultLock**: Auto-selected based on platform detection
 * - **Custom**: Any type with `lock()`/`unlock()` const members
 *
 * The `Tag` parameter names the owning type, which keeps the
 * `template<typename> class LockPolicy` shape usable as a template template argument.
 */

#ifndef CSCSYNC_PLATFORM_HPP_
#define CSCSYNC_PLATFORM_HPP_

// ---------------------- Lock Policy Implementations ----------------------

// No-op lock policy - zero overhead for single-task or externally synchronized use
template<typename /*Tag*/ = void>
struct NoLock {
    void lock() const {}
    void unlock() const {}
};

// ---------------------- Platform Detection ----------------------

#if defined(ESP_PLATFORM) || defined(IDF_VER) || \
    (defined(__has_include) && __has_include(<freertos/FreeRTOS.h>))
    #define CSCSYNC_HAS_FREERTOS
#endif

#if defined(CSCSYNC_HAS_FREERTOS) && !defined(CSCSYNC_NO_FREERTOS)
    #include <freertos/FreeRTOS.h>
    #include <freertos/semphr.h>

    /**
     * @brief FreeRTOS recursive mutex owned by one object
     * @warning MUST NOT be used from an ISR context
     */
    template<typename Tag = void>
    class FreeRTOSLock {
    public:
        using tag = Tag;

        FreeRTOSLock() noexcept : handle_(xSemaphoreCreateRecursiveMutexStatic(&buffer_)) {
            configASSERT(handle_ != nullptr);
        }

        ~FreeRTOSLock() {
            vSemaphoreDelete(handle_);
        }

        FreeRTOSLock(const FreeRTOSLock&) = delete;
        FreeRTOSLock& operator=(const FreeRTOSLock&) = delete;

        void lock() const {
            xSemaphoreTakeRecursive(handle_, portMAX_DELAY);
        }

        void unlock() const {
            xSemaphoreGiveRecursive(handle_);
        }

    private:
        StaticSemaphore_t buffer_{};
        SemaphoreHandle_t handle_;
    };

    template<typename Tag = void>
    using DefaultLock = FreeRTOSLock<Tag>;
#else
    template<typename Tag = void>
    using DefaultLock = NoLock<Tag>;

    #pragma message("CSCSYNC: No FreeRTOS detected, using NoLock (no thread safety). " \
                    "Provide a lock policy explicitly if tasks share a SpeedController.")
#endif

// ---------------------- Synchronization Primitives ----------------------

namespace cscsync_sync {

// RAII lock guard
template<typename Lock>
class LockGuard {
    const Lock& lock;
public:
    explicit LockGuard(const Lock& l) : lock(l) { lock.lock(); }
    ~LockGuard() { lock.unlock(); }
    LockGuard(const LockGuard&) = delete;
    LockGuard& operator=(const LockGuard&) = delete;
};

} // namespace cscsync_sync

#endif // CSCSYNC_PLATFORM_HPP_
