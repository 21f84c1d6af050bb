#pragma once

#include <cstdint>
#include "telemetry.hpp"

enum class FaultSource : uint8_t {
    None = 0,
    SensorTask,
    IrrigationTask,
    UplinkTask,
    DisplayTask,
    Connectivity,
};

struct FaultCounters {
    uint32_t faults_latched;
    uint32_t faults_cleared;
    uint32_t remedies_applied;
    uint32_t step_overruns;
    uint32_t task_timeouts;
};

struct FaultStatus {
    ErrorCode active;
    FaultSource owner;
    uint32_t active_since_ms;
    uint32_t last_remedy_ms;
    uint32_t remedy_attempts;
    FaultCounters counters;
};

// Holds the single most severe unresolved error. A failure is latched unless
// something strictly more severe is already active; only the owner of the
// latched error can clear it.
class FaultMonitor {
public:
    FaultMonitor();

    void reset();
    bool raise(ErrorCode code, FaultSource source, uint32_t now_ms);
    bool resolve(FaultSource source, uint32_t now_ms);

    bool active() const { return status_.active != ErrorCode::None; }
    ErrorCode active_code() const { return status_.active; }
    uint32_t active_for_ms(uint32_t now_ms) const;
    bool remedy_due(uint32_t now_ms, uint32_t interval_ms) const;
    void note_remedy(uint32_t now_ms);
    void note_step_overrun();
    void note_task_timeout();

    const FaultStatus& status() const { return status_; }

private:
    FaultStatus status_;
};

FaultSource fault_source_for(TaskId id);
const char* fault_source_name(FaultSource source);
