#include "sensors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>

namespace {
constexpr const char* kTag = "SENSOR";

int& field_for(SensorReading& r, AnalogChannel ch) {
    switch (ch) {
        case AnalogChannel::Light: return r.light_level;
        case AnalogChannel::Rain: return r.rain_level;
        case AnalogChannel::AirQuality: return r.air_quality_raw;
        case AnalogChannel::Soil:
        default: return r.soil_moisture;
    }
}

constexpr std::array<AnalogChannel, kAnalogChannelCount> kChannels{{
    AnalogChannel::Light,
    AnalogChannel::Rain,
    AnalogChannel::AirQuality,
    AnalogChannel::Soil,
}};
} // namespace

float air_quality_ppm(int raw, const AirQualityCurve& curve) {
    if (raw <= kRawChannelMin) {
        return 0.0f;
    }
    if (raw >= kRawChannelMax) {
        return curve.max_ppm;
    }
    const float vout = curve.vref_v * static_cast<float>(raw) / static_cast<float>(kRawChannelMax);
    const float rs = curve.load_ohms * ((curve.vref_v / vout) - 1.0f);
    const float ppm = curve.a * std::pow(rs / curve.r0_ohms, curve.b);
    if (!std::isfinite(ppm)) {
        return curve.max_ppm;
    }
    return std::clamp(ppm, 0.0f, curve.max_ppm);
}

bool climate_plausible(float temperature_c, float humidity_pct, const SensorConfig& cfg) {
    if (!std::isfinite(temperature_c) || !std::isfinite(humidity_pct)) {
        return false;
    }
    if (temperature_c < cfg.min_temperature_c || temperature_c > cfg.max_temperature_c) {
        return false;
    }
    return humidity_pct >= 0.0f && humidity_pct <= 100.0f;
}

SensorTask::SensorTask()
    : staged_{},
      worst_(ErrorCode::None),
      climate_attempts_(0),
      next_climate_ms_(0),
      channels_done_(false),
      climate_done_(false),
      climate_seen_(false),
      channel_seen_{} {}

void SensorTask::start(DeviceContext& ctx, uint32_t now_ms) {
    // Starting from the committed reading makes every untouched field the
    // last-known-good value (or the boot default).
    staged_ = ctx.reading;
    worst_ = ErrorCode::None;
    climate_attempts_ = 0;
    next_climate_ms_ = now_ms;
    channels_done_ = false;
    climate_done_ = false;
}

TaskOutcome SensorTask::step(DeviceContext& ctx, uint32_t now_ms) {
    if (!channels_done_) {
        read_channels(ctx);
        channels_done_ = true;
    }
    if (!climate_done_ && static_cast<int32_t>(now_ms - next_climate_ms_) >= 0) {
        climate_done_ = read_climate(ctx, now_ms);
    }
    if (!climate_done_) {
        return running();
    }
    return commit(ctx, now_ms);
}

void SensorTask::abort(DeviceContext& ctx, uint32_t now_ms) {
    (void)ctx;
    (void)now_ms;
    log_warn(kTag, "acquisition aborted after %u probe attempts", static_cast<unsigned>(climate_attempts_));
}

void SensorTask::read_channels(DeviceContext& ctx) {
    for (AnalogChannel ch : kChannels) {
        const int raw = ctx.io.sensors->read_channel(ch);
        if (!raw_in_range(raw)) {
            log_warn(kTag, "%s raw=%d out of range, keeping %d", channel_name(ch), raw, field_for(staged_, ch));
            note_error(channel_error(ch));
            continue;
        }
        field_for(staged_, ch) = raw;
        channel_seen_[static_cast<std::size_t>(ch)] = true;
    }
    staged_.air_quality_ppm = air_quality_ppm(staged_.air_quality_raw, ctx.cfg.sensor.air_curve);
}

bool SensorTask::read_climate(DeviceContext& ctx, uint32_t now_ms) {
    const SensorConfig& cfg = ctx.cfg.sensor;
    climate_attempts_++;
    float temperature = 0.0f;
    float humidity = 0.0f;
    if (ctx.io.sensors->read_climate(temperature, humidity) && climate_plausible(temperature, humidity, cfg)) {
        staged_.temperature = temperature;
        staged_.humidity = humidity;
        climate_seen_ = true;
        return true;
    }
    if (climate_attempts_ < cfg.climate_attempts) {
        log_debug(kTag, "climate probe attempt %u failed, retry in %lu ms", static_cast<unsigned>(climate_attempts_),
                  static_cast<unsigned long>(cfg.climate_retry_delay_ms));
        next_climate_ms_ = now_ms + cfg.climate_retry_delay_ms;
        return false;
    }
    log_warn(kTag, "climate probe failed %u times, keeping %.1fC %.1f%%", static_cast<unsigned>(climate_attempts_),
             static_cast<double>(staged_.temperature), static_cast<double>(staged_.humidity));
    note_error(ErrorCode::SensorDHT);
    return true;
}

TaskOutcome SensorTask::commit(DeviceContext& ctx, uint32_t now_ms) {
    staged_.timestamp = ctx.connectivity.epoch_seconds(now_ms);
    staged_.valid = climate_seen_ &&
                    std::all_of(channel_seen_.begin(), channel_seen_.end(), [](bool seen) { return seen; });
    ctx.reading = staged_;
    if (worst_ != ErrorCode::None) {
        return failed(worst_);
    }
    return completed();
}

void SensorTask::note_error(ErrorCode code) {
    if (outranks(code, worst_)) {
        worst_ = code;
    }
}
