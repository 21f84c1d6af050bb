#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include "config.hpp"
#include "connectivity.hpp"
#include "context.hpp"
#include "display.hpp"
#include "fault.hpp"
#include "io_ports.hpp"
#include "irrigation.hpp"
#include "sensors.hpp"
#include "telemetry.hpp"
#include "uplink.hpp"
#include "watchdog.hpp"

struct TaskStatus {
    TaskHeartbeat heartbeat;
    TaskState state;
    TaskOutcome last_outcome;
    uint32_t runs;
    uint32_t failures;
    uint32_t skipped_cycles;
};

struct SupervisorStatus {
    std::array<TaskStatus, kTaskCount> tasks;
    FaultStatus faults;
    ConnectivityStatus connectivity;
    uint32_t ticks;
};

// Cooperative scheduler and error supervisor. One tick strokes the watchdog,
// services connectivity, then steps sensor, irrigation, uplink and display
// in that order, consumes their outcomes and runs the recovery policy.
class Supervisor {
public:
    using ClockFn = uint32_t (*)();

    Supervisor(const DeviceConfig& cfg, const DeviceIo& io, ClockFn clock = uptime_ms);
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    SupervisorStatus tick(uint32_t now_ms);

    DeviceContext& context() { return ctx_; }
    const DeviceContext& context() const { return ctx_; }
    const SupervisorStatus& status() const { return status_; }
    const TaskStatus& task_status(TaskId id) const { return status_.tasks[static_cast<std::size_t>(id)]; }

private:
    struct TaskSlot {
        TaskId id;
        TaskTiming timing;
        ManagedTask* task;
        ErrorCode timeout_error;
        TaskState state;
        uint32_t last_release_ms;
        uint32_t started_ms;
        uint32_t hold_until_ms;
        bool held;
        bool released;
    };

    bool due(const TaskSlot& slot, uint32_t now_ms) const;
    void run_slot(TaskSlot& slot, uint32_t now_ms);
    void step_slot(TaskSlot& slot, uint32_t now_ms);
    void consume(TaskSlot& slot, TaskOutcome outcome, uint32_t now_ms);
    void service_connectivity(uint32_t now_ms);
    void run_recovery(uint32_t now_ms);
    TaskSlot& slot(TaskId id) { return slots_[static_cast<std::size_t>(id)]; }

    DeviceContext ctx_;
    ClockFn clock_;
    SensorTask sensor_;
    IrrigationTask irrigation_;
    UplinkTask uplink_;
    DisplayPresenter display_;
    std::array<TaskSlot, kTaskCount> slots_;
    SupervisorStatus status_;
};

// Runs the supervisor forever at cfg.tick_ms on FreeRTOS targets.
void run_supervisor_loop(Supervisor& supervisor, const DeviceConfig& cfg);
