#include "board_io.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "tasks.hpp"

#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

namespace {
DeviceConfig g_cfg;
DeviceIo g_io;

void supervisor_task(void* arg) {
    (void)arg;
    // The supervisor holds references into g_cfg; both outlive the task.
    static Supervisor supervisor(g_cfg, g_io);
    run_supervisor_loop(supervisor, g_cfg);
    vTaskDelete(nullptr);
}
} // namespace

extern "C" void app_main(void) {
    init_logging();
    log_info("MAIN", "AgriNode (IDF) booting...");

    g_cfg = load_config();
    g_io = init_board_io(g_cfg);

    // One cooperative task drives everything; no other task touches the ports.
    if (xTaskCreate(supervisor_task, "supervisor", 6144, nullptr, 5, nullptr) != pdPASS) {
        log_error("MAIN", "supervisor task could not be created");
        return;
    }

    // Sleep forever while the supervisor runs.
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
