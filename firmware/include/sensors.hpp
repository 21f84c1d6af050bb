#pragma once

#include <array>
#include <cstdint>
#include "config.hpp"
#include "context.hpp"
#include "telemetry.hpp"

float air_quality_ppm(int raw, const AirQualityCurve& curve);
bool climate_plausible(float temperature_c, float humidity_pct, const SensorConfig& cfg);

// One acquisition cycle per Running episode. Analog channels are read on the
// first step; the combined probe may need further steps while it settles.
// The staged reading is committed to the context only when the cycle ends.
class SensorTask : public ManagedTask {
public:
    SensorTask();

    void start(DeviceContext& ctx, uint32_t now_ms) override;
    TaskOutcome step(DeviceContext& ctx, uint32_t now_ms) override;
    void abort(DeviceContext& ctx, uint32_t now_ms) override;

private:
    void read_channels(DeviceContext& ctx);
    bool read_climate(DeviceContext& ctx, uint32_t now_ms);
    TaskOutcome commit(DeviceContext& ctx, uint32_t now_ms);
    void note_error(ErrorCode code);

    SensorReading staged_;
    ErrorCode worst_;
    uint8_t climate_attempts_;
    uint32_t next_climate_ms_;
    bool channels_done_;
    bool climate_done_;
    bool climate_seen_;
    std::array<bool, kAnalogChannelCount> channel_seen_;
};
