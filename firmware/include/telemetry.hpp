#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

constexpr int kRawChannelMin = 0;
constexpr int kRawChannelMax = 1023;

enum class AnalogChannel : uint8_t {
    Light = 0,
    Rain,
    AirQuality,
    Soil,
};

constexpr std::size_t kAnalogChannelCount = 4;

// Declaration order is severity order: later entries outrank earlier ones.
enum class ErrorCode : uint8_t {
    None = 0,
    SensorDHT,
    SensorSoil,
    SensorRain,
    SensorAir,
    SensorLight,
    Actuator,
    Connectivity,
    RemoteService,
    TimeSync,
};

enum class TaskState : uint8_t {
    Idle = 0,
    Running,
    Completed,
    Failed,
};

enum class TaskId : uint8_t {
    Sensor = 0,
    Irrigation,
    Uplink,
    Display,
};

constexpr std::size_t kTaskCount = 4;

struct SensorReading {
    float temperature;
    float humidity;
    int light_level;
    int rain_level;
    int air_quality_raw;
    int soil_moisture;
    float air_quality_ppm;
    uint32_t timestamp;
    bool valid;
};

struct TaskOutcome {
    TaskState state;
    ErrorCode error;
};

struct TaskHeartbeat {
    const char* name;
    uint32_t last_beat_ms;
};

inline bool outranks(ErrorCode a, ErrorCode b) {
    return static_cast<uint8_t>(a) > static_cast<uint8_t>(b);
}

inline TaskOutcome running() { return {TaskState::Running, ErrorCode::None}; }
inline TaskOutcome completed() { return {TaskState::Completed, ErrorCode::None}; }
inline TaskOutcome failed(ErrorCode code) { return {TaskState::Failed, code}; }

inline bool raw_in_range(int raw) {
    return raw >= kRawChannelMin && raw <= kRawChannelMax;
}

ErrorCode channel_error(AnalogChannel ch);
const char* channel_name(AnalogChannel ch);
const char* error_code_name(ErrorCode code);
const char* task_state_name(TaskState state);
bool is_sensor_error(ErrorCode code);
