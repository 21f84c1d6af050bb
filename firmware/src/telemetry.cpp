#include "telemetry.hpp"

ErrorCode channel_error(AnalogChannel ch) {
    switch (ch) {
        case AnalogChannel::Light: return ErrorCode::SensorLight;
        case AnalogChannel::Rain: return ErrorCode::SensorRain;
        case AnalogChannel::AirQuality: return ErrorCode::SensorAir;
        case AnalogChannel::Soil: return ErrorCode::SensorSoil;
    }
    return ErrorCode::None;
}

const char* channel_name(AnalogChannel ch) {
    switch (ch) {
        case AnalogChannel::Light: return "light";
        case AnalogChannel::Rain: return "rain";
        case AnalogChannel::AirQuality: return "air";
        case AnalogChannel::Soil: return "soil";
    }
    return "?";
}

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::SensorDHT: return "SensorDHT";
        case ErrorCode::SensorSoil: return "SensorSoil";
        case ErrorCode::SensorRain: return "SensorRain";
        case ErrorCode::SensorAir: return "SensorAir";
        case ErrorCode::SensorLight: return "SensorLight";
        case ErrorCode::Actuator: return "Actuator";
        case ErrorCode::Connectivity: return "Connectivity";
        case ErrorCode::RemoteService: return "RemoteService";
        case ErrorCode::TimeSync: return "TimeSync";
    }
    return "Unknown";
}

const char* task_state_name(TaskState state) {
    switch (state) {
        case TaskState::Idle: return "Idle";
        case TaskState::Running: return "Running";
        case TaskState::Completed: return "Completed";
        case TaskState::Failed: return "Failed";
    }
    return "Unknown";
}

bool is_sensor_error(ErrorCode code) {
    return code == ErrorCode::SensorDHT || code == ErrorCode::SensorSoil ||
           code == ErrorCode::SensorRain || code == ErrorCode::SensorAir ||
           code == ErrorCode::SensorLight;
}
