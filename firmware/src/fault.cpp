#include "fault.hpp"
#include "logging.hpp"

namespace {
constexpr const char* kTag = "FAULT";
} // namespace

FaultMonitor::FaultMonitor() {
    reset();
}

void FaultMonitor::reset() {
    status_ = FaultStatus{ErrorCode::None, FaultSource::None, 0, 0, 0, {0, 0, 0, 0, 0}};
}

bool FaultMonitor::raise(ErrorCode code, FaultSource source, uint32_t now_ms) {
    if (code == ErrorCode::None) {
        return false;
    }
    if (outranks(status_.active, code)) {
        log_debug(kTag, "%s from %s masked by active %s", error_code_name(code),
                  fault_source_name(source), error_code_name(status_.active));
        return false;
    }
    if (status_.active != code) {
        // A new episode; the recovery clock starts over.
        status_.active_since_ms = now_ms;
        status_.remedy_attempts = 0;
        status_.last_remedy_ms = now_ms;
        status_.counters.faults_latched++;
        log_warn(kTag, "latched %s (owner=%s)", error_code_name(code), fault_source_name(source));
    }
    status_.active = code;
    status_.owner = source;
    return true;
}

bool FaultMonitor::resolve(FaultSource source, uint32_t now_ms) {
    if (status_.active == ErrorCode::None || status_.owner != source) {
        return false;
    }
    log_info(kTag, "cleared %s after %lu ms", error_code_name(status_.active),
             static_cast<unsigned long>(now_ms - status_.active_since_ms));
    status_.active = ErrorCode::None;
    status_.owner = FaultSource::None;
    status_.remedy_attempts = 0;
    status_.counters.faults_cleared++;
    return true;
}

uint32_t FaultMonitor::active_for_ms(uint32_t now_ms) const {
    if (!active()) {
        return 0;
    }
    return now_ms - status_.active_since_ms;
}

bool FaultMonitor::remedy_due(uint32_t now_ms, uint32_t interval_ms) const {
    if (!active() || active_for_ms(now_ms) < interval_ms) {
        return false;
    }
    return status_.remedy_attempts == 0 || (now_ms - status_.last_remedy_ms) >= interval_ms;
}

void FaultMonitor::note_remedy(uint32_t now_ms) {
    status_.remedy_attempts++;
    status_.last_remedy_ms = now_ms;
    status_.counters.remedies_applied++;
}

void FaultMonitor::note_step_overrun() {
    status_.counters.step_overruns++;
}

void FaultMonitor::note_task_timeout() {
    status_.counters.task_timeouts++;
}

FaultSource fault_source_for(TaskId id) {
    switch (id) {
        case TaskId::Sensor: return FaultSource::SensorTask;
        case TaskId::Irrigation: return FaultSource::IrrigationTask;
        case TaskId::Uplink: return FaultSource::UplinkTask;
        case TaskId::Display: return FaultSource::DisplayTask;
    }
    return FaultSource::None;
}

const char* fault_source_name(FaultSource source) {
    switch (source) {
        case FaultSource::None: return "none";
        case FaultSource::SensorTask: return "sensor";
        case FaultSource::IrrigationTask: return "irrigation";
        case FaultSource::UplinkTask: return "uplink";
        case FaultSource::DisplayTask: return "display";
        case FaultSource::Connectivity: return "connectivity";
    }
    return "?";
}
