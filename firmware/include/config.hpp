#pragma once

#include <string>
#include <cstdint>
#include <array>
#include "telemetry.hpp"

enum class StatusTier : uint8_t {
    Low = 0,
    Medium,
    High,
};

// inverted=true means a larger raw value maps to a lower tier (light, rain).
struct ChannelThreshold {
    float low;
    float high;
    bool inverted;
};

struct ThresholdTable {
    ChannelThreshold temperature;
    ChannelThreshold humidity;
    ChannelThreshold light;
    ChannelThreshold rain;
    ChannelThreshold air_quality_ppm;
    ChannelThreshold soil;
};

struct TaskTiming {
    const char* name;
    uint32_t period_ms;
    uint32_t timeout_ms;
    uint32_t step_budget_ms;
};

// ppm = a * (Rs / R0)^b with Rs = RL * (Vref / Vout - 1)
struct AirQualityCurve {
    float vref_v;
    float load_ohms;
    float r0_ohms;
    float a;
    float b;
    float max_ppm;
};

struct SensorConfig {
    uint8_t climate_attempts;
    uint32_t climate_retry_delay_ms;
    float min_temperature_c;
    float max_temperature_c;
    float default_temperature_c;
    float default_humidity_pct;
    std::array<int, kAnalogChannelCount> default_raw;
    AirQualityCurve air_curve;
};

struct IrrigationConfig {
    int dryness_threshold;
    int heavy_rain_threshold;
    int light_rain_threshold;
    int partial_target;
    int full_target;
    uint32_t max_duration_ms;
};

struct UplinkConfig {
    std::string url;
    uint32_t timeout_ms;
    uint8_t failure_limit;
    uint32_t retry_backoff_ms;
};

struct NetworkConfig {
    std::string ssid;
    std::string password;
    std::string ntp_server;
    uint32_t associate_timeout_ms;
    uint32_t reconnect_backoff_ms;
    uint32_t time_sync_timeout_ms;
};

struct DisplayConfig {
    uint32_t rotation_ms;
    uint32_t error_timeout_ms;
};

struct DeviceConfig {
    std::string device_id;
    uint32_t tick_ms;
    uint32_t watchdog_timeout_ms;
    ThresholdTable thresholds;
    SensorConfig sensor;
    IrrigationConfig irrigation;
    UplinkConfig uplink;
    NetworkConfig network;
    DisplayConfig display;
    std::array<TaskTiming, kTaskCount> tasks;
};

DeviceConfig load_config();

const TaskTiming& task_timing(const DeviceConfig& cfg, TaskId id);
StatusTier classify(float value, const ChannelThreshold& threshold);
const char* status_tier_name(StatusTier tier);
