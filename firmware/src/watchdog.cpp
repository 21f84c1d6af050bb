#include "watchdog.hpp"

#if defined(ESP_PLATFORM)
#include "esp_timer.h"
#else
#include <chrono>
#endif

#if defined(AGN_HW_WDT) && defined(ESP_PLATFORM)
#include "freertos/FreeRTOS.h"
#include "esp_err.h"
#include "esp_log.h"
#include "esp_task_wdt.h"
#endif

namespace {
uint32_t g_feed_count = 0;

#if defined(AGN_HW_WDT) && defined(ESP_PLATFORM)
constexpr const char* kTag = "WDT";
#endif
} // namespace

void watchdog_init(uint32_t timeout_ms) {
#if defined(AGN_HW_WDT) && defined(ESP_PLATFORM)
    const uint32_t timeout_s = timeout_ms == 0 ? 8 : (timeout_ms + 999) / 1000;
    esp_task_wdt_config_t cfg = {
        .timeout_ms = timeout_s * 1000,
        .idle_core_mask = 0,
        .trigger_panic = true,
    };
    // The bootloader may already have started the TWDT; reconfigure in that case.
    esp_err_t err = esp_task_wdt_init(&cfg);
    if (err == ESP_ERR_INVALID_STATE) {
        err = esp_task_wdt_reconfigure(&cfg);
    }
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "task wdt init failed: %s", esp_err_to_name(err));
        return;
    }
    ESP_LOGI(kTag, "task wdt armed (%lu s, panic on expiry)", static_cast<unsigned long>(timeout_s));
#else
    (void)timeout_ms;
#endif
    g_feed_count = 0;
}

void watchdog_register_task(const char* name) {
#if defined(AGN_HW_WDT) && defined(ESP_PLATFORM)
    const esp_err_t err = esp_task_wdt_add(NULL); // add current task
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "esp_task_wdt_add(%s) failed: %s", name, esp_err_to_name(err));
    }
#else
    (void)name;
#endif
}

void watchdog_feed(const char* name) {
    (void)name;
#if defined(AGN_HW_WDT) && defined(ESP_PLATFORM)
    esp_task_wdt_reset();
#endif
    g_feed_count++;
}

uint32_t watchdog_feed_count() {
    return g_feed_count;
}

uint32_t uptime_ms() {
#if defined(ESP_PLATFORM)
    return static_cast<uint32_t>(esp_timer_get_time() / 1000ULL);
#else
    static const auto boot = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::steady_clock::now() - boot;
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
#endif
}
