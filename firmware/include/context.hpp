#pragma once

#include <array>
#include <cstdint>
#include "config.hpp"
#include "connectivity.hpp"
#include "fault.hpp"
#include "io_ports.hpp"
#include "telemetry.hpp"

enum class IrrigationPhase : uint8_t {
    Evaluate = 0,
    Skip,
    PartialCycle,
    FullCycle,
    Complete,
};

struct IrrigationStatus {
    IrrigationPhase phase;
    IrrigationPhase last_decision;
    bool actuator_on;
    uint32_t activated_ms;
    uint32_t cycles;
    uint32_t cap_hits;
};

struct UplinkStats {
    uint32_t sent;
    uint32_t failed;
    uint32_t consecutive_failures;
    uint32_t reassociation_requests;
    int last_http_status;
};

// Everything the managed tasks share. Owned by the Supervisor and handed to
// each step by reference; the reading is written only by the sensor task.
struct DeviceContext {
    DeviceContext(const DeviceConfig& config, const DeviceIo& ports);

    const DeviceConfig& cfg;
    DeviceIo io;
    ConnectivityManager connectivity;
    FaultMonitor faults;
    SensorReading reading;
    IrrigationStatus irrigation;
    UplinkStats uplink;
    std::array<TaskState, kTaskCount> task_states;
};

// A task the supervisor drives. start() runs on Idle -> Running, step() on
// every tick while Running and must return within the task's step budget,
// abort() when the supervisor gives up on the cycle.
class ManagedTask {
public:
    virtual ~ManagedTask() = default;
    virtual void start(DeviceContext& ctx, uint32_t now_ms) = 0;
    virtual TaskOutcome step(DeviceContext& ctx, uint32_t now_ms) = 0;
    virtual void abort(DeviceContext& ctx, uint32_t now_ms) = 0;
};

SensorReading default_reading(const SensorConfig& cfg);
const char* irrigation_phase_name(IrrigationPhase phase);
