#include "tasks.hpp"
#include "logging.hpp"

#ifdef AGN_FREERTOS
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"
#endif

namespace {
constexpr const char* kTag = "SUPERVISOR";

ErrorCode timeout_error_for(TaskId id) {
    switch (id) {
        case TaskId::Sensor: return ErrorCode::SensorDHT;
        case TaskId::Irrigation: return ErrorCode::Actuator;
        case TaskId::Uplink: return ErrorCode::RemoteService;
        case TaskId::Display:
        default: return ErrorCode::None;
    }
}
} // namespace

Supervisor::Supervisor(const DeviceConfig& cfg, const DeviceIo& io, ClockFn clock)
    : ctx_(cfg, io),
      clock_(clock),
      sensor_(),
      irrigation_(),
      uplink_(),
      display_(),
      slots_{},
      status_{} {
    ManagedTask* const tasks[kTaskCount] = {&sensor_, &irrigation_, &uplink_, &display_};
    for (std::size_t i = 0; i < kTaskCount; ++i) {
        const TaskId id = static_cast<TaskId>(i);
        slots_[i] = TaskSlot{id, task_timing(cfg, id), tasks[i], timeout_error_for(id), TaskState::Idle, 0, 0, 0, false, false};
        status_.tasks[i].heartbeat = {slots_[i].timing.name, 0};
        status_.tasks[i].state = TaskState::Idle;
        status_.tasks[i].last_outcome = {TaskState::Idle, ErrorCode::None};
    }
}

SupervisorStatus Supervisor::tick(uint32_t now_ms) {
    watchdog_feed("supervisor");
    service_connectivity(now_ms);

    for (auto& s : slots_) {
        run_slot(s, now_ms);
    }

    run_recovery(now_ms);

    for (std::size_t i = 0; i < kTaskCount; ++i) {
        ctx_.task_states[i] = slots_[i].state;
        status_.tasks[i].state = slots_[i].state;
    }
    status_.faults = ctx_.faults.status();
    status_.connectivity = ctx_.connectivity.status();
    status_.ticks++;
    return status_;
}

bool Supervisor::due(const TaskSlot& s, uint32_t now_ms) const {
    if (s.held) {
        return false;
    }
    return !s.released || (now_ms - s.last_release_ms) >= s.timing.period_ms;
}

void Supervisor::run_slot(TaskSlot& s, uint32_t now_ms) {
    TaskStatus& st = status_.tasks[static_cast<std::size_t>(s.id)];
    // Holds are shorter than half the clock range, so the signed difference
    // is valid for as long as one is pending.
    if (s.held && static_cast<int32_t>(now_ms - s.hold_until_ms) >= 0) {
        s.held = false;
    }
    if (s.state == TaskState::Idle) {
        if (!due(s, now_ms)) {
            return;
        }
        s.state = TaskState::Running;
        s.released = true;
        s.last_release_ms = now_ms;
        s.started_ms = now_ms;
        st.runs++;
        s.task->start(ctx_, now_ms);
    } else if (s.state == TaskState::Running) {
        if (due(s, now_ms)) {
            // Best effort: a cadence missed while busy is dropped, not queued.
            st.skipped_cycles++;
            s.last_release_ms = now_ms;
        }
        if ((now_ms - s.started_ms) >= s.timing.timeout_ms) {
            log_warn(kTag, "%s exceeded its %lu ms deadline", s.timing.name, static_cast<unsigned long>(s.timing.timeout_ms));
            ctx_.faults.note_task_timeout();
            s.task->abort(ctx_, now_ms);
            consume(s, failed(s.timeout_error), now_ms);
            return;
        }
    }
    step_slot(s, now_ms);
}

void Supervisor::step_slot(TaskSlot& s, uint32_t now_ms) {
    TaskStatus& st = status_.tasks[static_cast<std::size_t>(s.id)];
    const uint32_t begin = clock_();
    const TaskOutcome outcome = s.task->step(ctx_, now_ms);
    const uint32_t elapsed = clock_() - begin;
    st.heartbeat.last_beat_ms = now_ms;
    if (elapsed > s.timing.step_budget_ms) {
        log_warn(kTag, "%s step took %lu ms (budget %lu ms)", s.timing.name, static_cast<unsigned long>(elapsed),
                 static_cast<unsigned long>(s.timing.step_budget_ms));
        ctx_.faults.note_step_overrun();
    }
    if (outcome.state == TaskState::Running) {
        return;
    }
    consume(s, outcome, now_ms);
}

void Supervisor::consume(TaskSlot& s, TaskOutcome outcome, uint32_t now_ms) {
    TaskStatus& st = status_.tasks[static_cast<std::size_t>(s.id)];
    st.last_outcome = outcome;
    const FaultSource source = fault_source_for(s.id);
    if (outcome.state == TaskState::Failed) {
        st.failures++;
        ctx_.faults.raise(outcome.error, source, now_ms);
    } else {
        ctx_.faults.resolve(source, now_ms);
    }
    // Outcome consumed; the task is eligible again on its next cadence.
    s.state = TaskState::Idle;
}

void Supervisor::service_connectivity(uint32_t now_ms) {
    ctx_.connectivity.service(now_ms);
    if (ctx_.connectivity.time_sync_fault()) {
        ctx_.faults.raise(ErrorCode::TimeSync, FaultSource::Connectivity, now_ms);
    } else if (ctx_.connectivity.time_synced()) {
        ctx_.faults.resolve(FaultSource::Connectivity, now_ms);
    }
}

void Supervisor::run_recovery(uint32_t now_ms) {
    const uint32_t interval = ctx_.cfg.display.error_timeout_ms;
    if (!ctx_.faults.remedy_due(now_ms, interval)) {
        return;
    }
    const ErrorCode code = ctx_.faults.active_code();
    log_info(kTag, "recovering from %s (active %lu ms)", error_code_name(code),
             static_cast<unsigned long>(ctx_.faults.active_for_ms(now_ms)));
    if (is_sensor_error(code)) {
        // Sensor faults heal on the next acquisition cycle.
        ctx_.faults.note_remedy(now_ms);
        return;
    }
    switch (code) {
        case ErrorCode::Connectivity:
            if (ctx_.connectivity.status().link != LinkState::Associating) {
                ctx_.connectivity.request_reassociation(now_ms);
            }
            break;
        case ErrorCode::RemoteService: {
            // A retry already scheduled is not pushed further out.
            TaskSlot& uplink = slot(TaskId::Uplink);
            if (!uplink.held) {
                uplink.held = true;
                uplink.hold_until_ms = now_ms + ctx_.cfg.uplink.retry_backoff_ms;
            }
            break;
        }
        case ErrorCode::Actuator:
            if (slot(TaskId::Irrigation).state != TaskState::Running) {
                irrigation_.force_off(ctx_);
            }
            break;
        case ErrorCode::TimeSync:
            ctx_.connectivity.request_time_sync(now_ms);
            break;
        default:
            break;
    }
    ctx_.faults.note_remedy(now_ms);
}

void run_supervisor_loop(Supervisor& supervisor, const DeviceConfig& cfg) {
#ifdef AGN_FREERTOS
    watchdog_init(cfg.watchdog_timeout_ms);
    watchdog_register_task("supervisor");
    TickType_t last_wake = xTaskGetTickCount();
    for (;;) {
        supervisor.tick(uptime_ms());
        vTaskDelayUntil(&last_wake, pdMS_TO_TICKS(cfg.tick_ms));
    }
#else
    (void)supervisor;
    (void)cfg;
#endif
}
