/**
 * @file speed_controller.hpp
 * @brief Sliding-window smoothing of instantaneous speed
 *
 * @details
 * Written by the monitor task, read by the playback task. Every member runs
 * under the instance lock, so a reader observes either the state before an
 * update or the state after it.
 *
 * @tparam LockPolicy Lock policy template (see platform.hpp)
 */

#ifndef CSCSYNC_SPEED_CONTROLLER_HPP_
#define CSCSYNC_SPEED_CONTROLLER_HPP_

#include "platform.hpp"

#include <cstddef>
#include <cstdint>

namespace cscsync {

template<template<typename> class LockPolicy = DefaultLock>
class SpeedController {
public:
    static constexpr size_t kMaxWindow = 64;

    /// Window size is clamped to [1, kMaxWindow]
    explicit SpeedController(const size_t windowSize) noexcept
        : window_(windowSize < 1 ? 1 : (windowSize > kMaxWindow ? kMaxWindow : windowSize)) {}

    SpeedController(const SpeedController&) = delete;
    SpeedController& operator=(const SpeedController&) = delete;

    /// Append a sample, evicting the oldest once the window is full
    void updateSpeed(const float speed) {
        cscsync_sync::LockGuard guard(lock_);
        samples_[head_] = speed;
        head_ = (head_ + 1) % window_;
        if (count_ < window_) {
            ++count_;
        }
    }

    /// Arithmetic mean of the window contents, 0 without samples
    [[nodiscard]] float smoothedSpeed() const {
        cscsync_sync::LockGuard guard(lock_);
        if (count_ == 0) {
            return 0.0f;
        }
        float sum = 0.0f;
        for (size_t i = 0; i < count_; ++i) {
            sum += samples_[i];
        }
        return sum / static_cast<float>(count_);
    }

    [[nodiscard]] size_t sampleCount() const {
        cscsync_sync::LockGuard guard(lock_);
        return count_;
    }

    [[nodiscard]] size_t windowSize() const noexcept { return window_; }

    /**
     * @brief Copy the window contents, oldest first
     * @return Number of samples written (at most max)
     */
    size_t snapshot(float* out, const size_t max) const {
        cscsync_sync::LockGuard guard(lock_);
        const size_t n = count_ < max ? count_ : max;
        const size_t oldest = count_ < window_ ? 0 : head_;
        const size_t skip = count_ - n;
        for (size_t i = 0; i < n; ++i) {
            out[i] = samples_[(oldest + skip + i) % window_];
        }
        return n;
    }

private:
    const size_t window_;
    float samples_[kMaxWindow]{};
    size_t head_ = 0;
    size_t count_ = 0;
    mutable LockPolicy<SpeedController> lock_;
};

}  // namespace cscsync

#endif // CSCSYNC_SPEED_CONTROLLER_HPP_
