#include "context.hpp"

DeviceContext::DeviceContext(const DeviceConfig& config, const DeviceIo& ports)
    : cfg(config),
      io(ports),
      connectivity(config.network, ports.network),
      faults(),
      reading(default_reading(config.sensor)),
      irrigation{IrrigationPhase::Evaluate, IrrigationPhase::Evaluate, false, 0, 0, 0},
      uplink{0, 0, 0, 0, 0},
      task_states{} {
    task_states.fill(TaskState::Idle);
}

SensorReading default_reading(const SensorConfig& cfg) {
    SensorReading r{};
    r.temperature = cfg.default_temperature_c;
    r.humidity = cfg.default_humidity_pct;
    r.light_level = cfg.default_raw[static_cast<std::size_t>(AnalogChannel::Light)];
    r.rain_level = cfg.default_raw[static_cast<std::size_t>(AnalogChannel::Rain)];
    r.air_quality_raw = cfg.default_raw[static_cast<std::size_t>(AnalogChannel::AirQuality)];
    r.soil_moisture = cfg.default_raw[static_cast<std::size_t>(AnalogChannel::Soil)];
    r.air_quality_ppm = 0.0f;
    r.timestamp = 0;
    r.valid = false;
    return r;
}

const char* irrigation_phase_name(IrrigationPhase phase) {
    switch (phase) {
        case IrrigationPhase::Evaluate: return "Evaluate";
        case IrrigationPhase::Skip: return "Skip";
        case IrrigationPhase::PartialCycle: return "Partial";
        case IrrigationPhase::FullCycle: return "Full";
        case IrrigationPhase::Complete: return "Complete";
    }
    return "?";
}
