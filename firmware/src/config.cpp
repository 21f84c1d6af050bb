#include "config.hpp"

DeviceConfig load_config() {
    DeviceConfig cfg{};
    cfg.device_id = "agrinode-001";
    cfg.tick_ms = 100;
    cfg.watchdog_timeout_ms = 8000;

    cfg.thresholds.temperature = {20.0f, 25.0f, false};
    cfg.thresholds.humidity = {70.0f, 80.0f, false};
    cfg.thresholds.light = {400.0f, 600.0f, true};
    cfg.thresholds.rain = {880.0f, 940.0f, true};
    cfg.thresholds.air_quality_ppm = {400.0f, 800.0f, false};
    cfg.thresholds.soil = {200.0f, 400.0f, false};

    cfg.sensor.climate_attempts = 3;
    cfg.sensor.climate_retry_delay_ms = 250;
    cfg.sensor.min_temperature_c = -40.0f;
    cfg.sensor.max_temperature_c = 80.0f;
    cfg.sensor.default_temperature_c = 25.0f;
    cfg.sensor.default_humidity_pct = 50.0f;
    // Light, rain, air, soil. Rain and soil default to "wet" so a channel that
    // was never read cannot start the pump.
    cfg.sensor.default_raw = {0, kRawChannelMax, 0, kRawChannelMax};
    cfg.sensor.air_curve = {5.0f, 10000.0f, 76630.0f, 116.6020682f, -2.769034857f, 10000.0f};

    cfg.irrigation.dryness_threshold = 200;
    cfg.irrigation.heavy_rain_threshold = 880;
    cfg.irrigation.light_rain_threshold = 990;
    cfg.irrigation.partial_target = 300;
    cfg.irrigation.full_target = 400;
    cfg.irrigation.max_duration_ms = 30000;

    // The body names the channels lightLevel and rainLevel. The legacy
    // ingestion server on this route validates ldrValue and rainValue and
    // answers 400 to every post; point this at a service that takes the
    // lightLevel/rainLevel schema.
    cfg.uplink.url = "http://192.168.1.10:3001/api/sensors/data";
    cfg.uplink.timeout_ms = 8000;
    cfg.uplink.failure_limit = 3;
    cfg.uplink.retry_backoff_ms = 10000;

    cfg.network.ssid = "agrinode";
    cfg.network.password = "";
    cfg.network.ntp_server = "pool.ntp.org";
    cfg.network.associate_timeout_ms = 10000;
    cfg.network.reconnect_backoff_ms = 5000;
    cfg.network.time_sync_timeout_ms = 15000;

    cfg.display.rotation_ms = 3000;
    cfg.display.error_timeout_ms = 5000;

    // Order matches TaskId. Irrigation may legitimately run for max_duration.
    cfg.tasks = {{
        {"SensorTask", 1000, 900, 50},
        {"IrrigationTask", 1000, cfg.irrigation.max_duration_ms + 5000, 20},
        {"UplinkTask", 1000, cfg.uplink.timeout_ms + 2000, 50},
        {"DisplayTask", 500, 400, 30},
    }};
    return cfg;
}

const TaskTiming& task_timing(const DeviceConfig& cfg, TaskId id) {
    return cfg.tasks[static_cast<std::size_t>(id)];
}

StatusTier classify(float value, const ChannelThreshold& threshold) {
    if (threshold.inverted) {
        if (value > threshold.high) return StatusTier::Low;
        if (value < threshold.low) return StatusTier::High;
        return StatusTier::Medium;
    }
    if (value < threshold.low) return StatusTier::Low;
    if (value > threshold.high) return StatusTier::High;
    return StatusTier::Medium;
}

const char* status_tier_name(StatusTier tier) {
    switch (tier) {
        case StatusTier::Low: return "LOW";
        case StatusTier::High: return "HIGH";
        case StatusTier::Medium:
        default: return "MED";
    }
}
