#pragma once

#include <cstdint>
#include "config.hpp"
#include "context.hpp"

// Pure decision for a reading that is dry enough to be evaluated at all.
// Rain is inverted: a lower raw value means more rain.
IrrigationPhase decide_irrigation(int rain_level, const IrrigationConfig& cfg);
bool soil_is_dry(const SensorReading& reading, const IrrigationConfig& cfg);

// Evaluate -> (Skip | PartialCycle | FullCycle) -> Complete. The actuator is
// driven low on every way out of a cycle, and never stays on longer than
// max_duration_ms after activation.
class IrrigationTask : public ManagedTask {
public:
    IrrigationTask();

    void start(DeviceContext& ctx, uint32_t now_ms) override;
    TaskOutcome step(DeviceContext& ctx, uint32_t now_ms) override;
    void abort(DeviceContext& ctx, uint32_t now_ms) override;

    // Used by the supervisor's actuator remedy.
    bool force_off(DeviceContext& ctx);

private:
    TaskOutcome evaluate(DeviceContext& ctx, uint32_t now_ms);
    TaskOutcome monitor(DeviceContext& ctx, uint32_t now_ms);
    TaskOutcome finish(DeviceContext& ctx);

    int target_;
};
