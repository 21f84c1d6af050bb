#include "irrigation.hpp"
#include "config.hpp"
#include "context.hpp"
#include "mock_io.hpp"

#include <cassert>

namespace {
SensorReading reading_with(int soil, int rain) {
    SensorReading r{};
    r.temperature = 24.0f;
    r.humidity = 65.0f;
    r.light_level = 550;
    r.rain_level = rain;
    r.air_quality_raw = 300;
    r.soil_moisture = soil;
    r.valid = true;
    return r;
}
} // namespace

int main() {
    const DeviceConfig cfg = load_config();
    const IrrigationConfig& irr = cfg.irrigation;

    // Band edges.
    assert(decide_irrigation(0, irr) == IrrigationPhase::Skip);
    assert(decide_irrigation(879, irr) == IrrigationPhase::Skip);
    assert(decide_irrigation(880, irr) == IrrigationPhase::PartialCycle);
    assert(decide_irrigation(989, irr) == IrrigationPhase::PartialCycle);
    assert(decide_irrigation(990, irr) == IrrigationPhase::FullCycle);
    assert(decide_irrigation(1023, irr) == IrrigationPhase::FullCycle);

    assert(soil_is_dry(reading_with(199, 1000), irr));
    assert(!soil_is_dry(reading_with(200, 1000), irr));
    SensorReading stale = reading_with(50, 1000);
    stale.valid = false;
    assert(!soil_is_dry(stale, irr));

    // Wet enough soil never starts the pump, whatever the rain.
    for (int rain : {0, 500, 879, 880, 950, 990, 1023}) {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        ctx.reading = reading_with(200, rain);
        task.start(ctx, 0);
        const TaskOutcome outcome = task.step(ctx, 0);
        assert(outcome.state == TaskState::Completed);
        assert(board.actuator.activations == 0);
        assert(!board.actuator.active);
    }

    // Dry soil under heavy rain: skip, and the pump stays off.
    {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        ctx.reading = reading_with(150, 500);
        task.start(ctx, 0);
        const TaskOutcome outcome = task.step(ctx, 0);
        assert(outcome.state == TaskState::Completed);
        assert(ctx.irrigation.last_decision == IrrigationPhase::Skip);
        assert(board.actuator.activations == 0);
        assert(ctx.irrigation.cycles == 0);
    }

    // temp=24.0 humidity=65 light=550 rain=950 air=300 soil=150: partial
    // cycle, pump on, soil tier Low.
    {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        ctx.reading = reading_with(150, 950);
        task.start(ctx, 0);
        assert(task.step(ctx, 0).state == TaskState::Running);
        assert(ctx.irrigation.phase == IrrigationPhase::PartialCycle);
        assert(board.actuator.active);
        assert(ctx.irrigation.actuator_on);
        assert(classify(150.0f, cfg.thresholds.soil) == StatusTier::Low);

        // Soil climbs; the partial target ends the cycle before the full one.
        ctx.reading.soil_moisture = 299;
        assert(task.step(ctx, 1000).state == TaskState::Running);
        ctx.reading.soil_moisture = irr.partial_target;
        assert(task.step(ctx, 2000).state == TaskState::Completed);
        assert(!board.actuator.active);
        assert(!ctx.irrigation.actuator_on);
        assert(ctx.irrigation.cycles == 1);
        assert(ctx.irrigation.cap_hits == 0);
    }

    // No rain: full cycle against the higher target.
    {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        ctx.reading = reading_with(150, 1010);
        task.start(ctx, 0);
        assert(task.step(ctx, 0).state == TaskState::Running);
        assert(ctx.irrigation.phase == IrrigationPhase::FullCycle);
        ctx.reading.soil_moisture = irr.partial_target;
        assert(task.step(ctx, 1000).state == TaskState::Running);
        ctx.reading.soil_moisture = irr.full_target;
        assert(task.step(ctx, 2000).state == TaskState::Completed);
        assert(!board.actuator.active);
    }

    // Pump driver refuses: the cycle fails with an actuator error.
    {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        board.actuator.fail_writes = true;
        ctx.reading = reading_with(150, 950);
        task.start(ctx, 0);
        const TaskOutcome outcome = task.step(ctx, 0);
        assert(outcome.state == TaskState::Failed);
        assert(outcome.error == ErrorCode::Actuator);
        assert(!ctx.irrigation.actuator_on);
    }

    // Abort mid-cycle drives the pump off.
    {
        MockBoard board;
        DeviceContext ctx(cfg, board.io());
        IrrigationTask task;
        ctx.reading = reading_with(150, 950);
        task.start(ctx, 0);
        assert(task.step(ctx, 0).state == TaskState::Running);
        task.abort(ctx, 500);
        assert(!board.actuator.active);
        assert(ctx.irrigation.phase == IrrigationPhase::Complete);
    }

    return 0;
}
