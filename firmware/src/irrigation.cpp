#include "irrigation.hpp"
#include "logging.hpp"

namespace {
constexpr const char* kTag = "IRRIGATION";
} // namespace

IrrigationPhase decide_irrigation(int rain_level, const IrrigationConfig& cfg) {
    if (rain_level < cfg.heavy_rain_threshold) {
        return IrrigationPhase::Skip;
    }
    if (rain_level < cfg.light_rain_threshold) {
        return IrrigationPhase::PartialCycle;
    }
    return IrrigationPhase::FullCycle;
}

bool soil_is_dry(const SensorReading& reading, const IrrigationConfig& cfg) {
    return reading.valid && reading.soil_moisture < cfg.dryness_threshold;
}

IrrigationTask::IrrigationTask() : target_(0) {}

void IrrigationTask::start(DeviceContext& ctx, uint32_t now_ms) {
    (void)now_ms;
    ctx.irrigation.phase = IrrigationPhase::Evaluate;
    target_ = 0;
}

TaskOutcome IrrigationTask::step(DeviceContext& ctx, uint32_t now_ms) {
    switch (ctx.irrigation.phase) {
        case IrrigationPhase::Evaluate:
            return evaluate(ctx, now_ms);
        case IrrigationPhase::PartialCycle:
        case IrrigationPhase::FullCycle:
            return monitor(ctx, now_ms);
        case IrrigationPhase::Skip:
        case IrrigationPhase::Complete:
        default:
            return finish(ctx);
    }
}

void IrrigationTask::abort(DeviceContext& ctx, uint32_t now_ms) {
    (void)now_ms;
    log_warn(kTag, "cycle aborted in %s", irrigation_phase_name(ctx.irrigation.phase));
    force_off(ctx);
    ctx.irrigation.phase = IrrigationPhase::Complete;
}

bool IrrigationTask::force_off(DeviceContext& ctx) {
    const bool ok = ctx.io.actuator->set_active(false);
    if (ok) {
        ctx.irrigation.actuator_on = false;
    } else {
        log_error(kTag, "actuator did not acknowledge OFF");
    }
    return ok;
}

TaskOutcome IrrigationTask::evaluate(DeviceContext& ctx, uint32_t now_ms) {
    const IrrigationConfig& cfg = ctx.cfg.irrigation;
    const SensorReading& r = ctx.reading;
    if (!soil_is_dry(r, cfg)) {
        return finish(ctx);
    }

    const IrrigationPhase decision = decide_irrigation(r.rain_level, cfg);
    ctx.irrigation.last_decision = decision;
    if (decision == IrrigationPhase::Skip) {
        log_info(kTag, "soil=%d dry but rain=%d below %d, skipping", r.soil_moisture, r.rain_level, cfg.heavy_rain_threshold);
        ctx.irrigation.phase = IrrigationPhase::Skip;
        return finish(ctx);
    }

    target_ = decision == IrrigationPhase::PartialCycle ? cfg.partial_target : cfg.full_target;
    if (!ctx.io.actuator->set_active(true)) {
        log_error(kTag, "actuator did not acknowledge ON");
        force_off(ctx);
        ctx.irrigation.phase = IrrigationPhase::Complete;
        return failed(ErrorCode::Actuator);
    }
    ctx.irrigation.actuator_on = true;
    ctx.irrigation.activated_ms = now_ms;
    ctx.irrigation.cycles++;
    ctx.irrigation.phase = decision;
    log_info(kTag, "%s cycle: soil=%d rain=%d target=%d cap=%lu ms", irrigation_phase_name(decision), r.soil_moisture,
             r.rain_level, target_, static_cast<unsigned long>(cfg.max_duration_ms));
    return running();
}

TaskOutcome IrrigationTask::monitor(DeviceContext& ctx, uint32_t now_ms) {
    const IrrigationConfig& cfg = ctx.cfg.irrigation;
    const int soil = ctx.reading.soil_moisture;
    if (soil >= target_) {
        log_info(kTag, "target %d reached (soil=%d)", target_, soil);
        return finish(ctx);
    }
    if ((now_ms - ctx.irrigation.activated_ms) >= cfg.max_duration_ms) {
        log_warn(kTag, "safety cap hit after %lu ms (soil=%d target=%d)",
                 static_cast<unsigned long>(now_ms - ctx.irrigation.activated_ms), soil, target_);
        ctx.irrigation.cap_hits++;
        return finish(ctx);
    }
    return running();
}

TaskOutcome IrrigationTask::finish(DeviceContext& ctx) {
    ctx.irrigation.phase = IrrigationPhase::Complete;
    if (!force_off(ctx)) {
        return failed(ErrorCode::Actuator);
    }
    return completed();
}
