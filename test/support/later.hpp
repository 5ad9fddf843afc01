// Runs a callable on its own FreeRTOS task after a delay. The destructor
// waits for the callable to finish.

#ifndef CSCSYNC_TEST_LATER_HPP_
#define CSCSYNC_TEST_LATER_HPP_

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>
#include <unity.h>

#include <functional>
#include <utility>

class Later {
public:
    Later(uint32_t delayMs, std::function<void()> fn)
        : delayMs_(delayMs), fn_(std::move(fn)), done_(xSemaphoreCreateBinaryStatic(&doneBuffer_)) {
        TEST_ASSERT_EQUAL(pdPASS, xTaskCreate(entry, "later", 4096, this, 1, nullptr));
    }

    ~Later() {
        xSemaphoreTake(done_, portMAX_DELAY);
        vSemaphoreDelete(done_);
    }

    Later(const Later&) = delete;
    Later& operator=(const Later&) = delete;

private:
    static void entry(void* arg) {
        auto* self = static_cast<Later*>(arg);
        vTaskDelay(pdMS_TO_TICKS(self->delayMs_));
        self->fn_();
        xSemaphoreGive(self->done_);
        vTaskDelete(nullptr);
    }

    uint32_t delayMs_;
    std::function<void()> fn_;
    StaticSemaphore_t doneBuffer_{};
    SemaphoreHandle_t done_;
};

#endif // CSCSYNC_TEST_LATER_HPP_
