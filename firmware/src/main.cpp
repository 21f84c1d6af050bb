#include <cstdio>
#include <cstdlib>
#include <cstring>
#include "board_io.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "tasks.hpp"
#include "watchdog.hpp"

// Host simulation: runs the supervisor against the simulated board for a
// number of seconds (argv[1], default 60) and prints a heartbeat line per
// simulated second. Time is simulated, so the run completes immediately.
// Passing "debug" as argv[2] enables debug logging.
int main(int argc, char** argv) {
    init_logging();
    log_info("MAIN", "AgriNode booting...");

    const DeviceConfig cfg = load_config();
    const long seconds = argc > 1 ? std::strtol(argv[1], nullptr, 10) : 60;
    if (seconds <= 0) {
        std::fprintf(stderr, "usage: %s [seconds] [debug]\n", argv[0]);
        return 2;
    }
    if (argc > 2 && std::strcmp(argv[2], "debug") == 0) {
        set_log_level(LogLevel::Debug);
    }

    watchdog_init(cfg.watchdog_timeout_ms);
    watchdog_register_task("supervisor");

    const DeviceIo io = init_board_io(cfg);
    Supervisor supervisor(cfg, io);

    const uint32_t end_ms = static_cast<uint32_t>(seconds) * 1000u;
    SupervisorStatus status{};
    for (uint32_t now_ms = 0; now_ms <= end_ms; now_ms += cfg.tick_ms) {
        status = supervisor.tick(now_ms);
        if (now_ms % 1000u != 0) {
            continue;
        }
        const DeviceContext& ctx = supervisor.context();
        std::printf(
            "[HEARTBEAT] t=%lu sensor=%lu/%s irrigation=%lu/%s uplink=%lu/%s display=%lu/%s soil=%d pump=%d sent=%lu failed=%lu error=%s\n",
            static_cast<unsigned long>(now_ms),
            static_cast<unsigned long>(status.tasks[0].heartbeat.last_beat_ms), task_state_name(status.tasks[0].state),
            static_cast<unsigned long>(status.tasks[1].heartbeat.last_beat_ms), task_state_name(status.tasks[1].state),
            static_cast<unsigned long>(status.tasks[2].heartbeat.last_beat_ms), task_state_name(status.tasks[2].state),
            static_cast<unsigned long>(status.tasks[3].heartbeat.last_beat_ms), task_state_name(status.tasks[3].state),
            ctx.reading.soil_moisture,
            ctx.irrigation.actuator_on ? 1 : 0,
            static_cast<unsigned long>(ctx.uplink.sent),
            static_cast<unsigned long>(ctx.uplink.failed),
            error_code_name(status.faults.active));
    }

    std::printf("[SUMMARY] ticks=%lu cycles=%lu cap_hits=%lu latched=%lu timeouts=%lu overruns=%lu wdt_feeds=%lu\n",
                static_cast<unsigned long>(status.ticks),
                static_cast<unsigned long>(supervisor.context().irrigation.cycles),
                static_cast<unsigned long>(supervisor.context().irrigation.cap_hits),
                static_cast<unsigned long>(status.faults.counters.faults_latched),
                static_cast<unsigned long>(status.faults.counters.task_timeouts),
                static_cast<unsigned long>(status.faults.counters.step_overruns),
                static_cast<unsigned long>(watchdog_feed_count()));
    return 0;
}
