#include "sensors.hpp"
#include "config.hpp"
#include "context.hpp"
#include "mock_io.hpp"

#include <cassert>

int main() {
    const DeviceConfig cfg = load_config();
    MockBoard board;
    DeviceContext ctx(cfg, board.io());
    SensorTask task;

    // Two failed probe reads: the cycle stays Running across ticks and the
    // retries wait for the configured delay instead of blocking.
    board.sensors.climate_failures = 2;
    task.start(ctx, 0);
    assert(task.step(ctx, 0).state == TaskState::Running);
    assert(board.sensors.climate_reads == 1);
    assert(task.step(ctx, 100).state == TaskState::Running);
    assert(board.sensors.climate_reads == 1);
    assert(task.step(ctx, 250).state == TaskState::Running);
    assert(board.sensors.climate_reads == 2);
    const TaskOutcome ok = task.step(ctx, 500);
    assert(ok.state == TaskState::Completed);
    assert(board.sensors.climate_reads == 3);
    // Analog channels are read once per cycle, not per retry.
    assert(board.sensors.channel_reads == static_cast<int>(kAnalogChannelCount));
    assert(ctx.reading.temperature == 24.0f);
    assert(ctx.reading.valid);

    // Probe gone: after the attempts run out the last good values are kept.
    board.sensors.climate_ok = false;
    board.sensors.temperature = 31.0f;
    task.start(ctx, 1000);
    uint32_t now_ms = 1000;
    TaskOutcome outcome = task.step(ctx, now_ms);
    while (outcome.state == TaskState::Running) {
        now_ms += 100;
        assert(now_ms < 1000 + task_timing(cfg, TaskId::Sensor).timeout_ms);
        outcome = task.step(ctx, now_ms);
    }
    assert(outcome.state == TaskState::Failed);
    assert(outcome.error == ErrorCode::SensorDHT);
    assert(board.sensors.climate_reads == 3 + cfg.sensor.climate_attempts);
    assert(ctx.reading.temperature == 24.0f);
    assert(ctx.reading.humidity == 65.0f);

    // A channel fault outranks the probe fault in the same cycle.
    board.sensors.set_raw(AnalogChannel::Rain, 5000);
    task.start(ctx, 2000);
    now_ms = 2000;
    outcome = task.step(ctx, now_ms);
    while (outcome.state == TaskState::Running) {
        now_ms += 100;
        outcome = task.step(ctx, now_ms);
    }
    assert(outcome.error == ErrorCode::SensorRain);

    // Recovery: the next clean cycle completes.
    board.sensors.climate_ok = true;
    board.sensors.set_raw(AnalogChannel::Rain, 950);
    task.start(ctx, 3000);
    assert(task.step(ctx, 3000).state == TaskState::Completed);
    assert(ctx.reading.temperature == 31.0f);

    return 0;
}
