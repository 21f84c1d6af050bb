#include "tasks.hpp"
#include "config.hpp"
#include "mock_io.hpp"

#include <cassert>

int main() {
    const DeviceConfig cfg = load_config();
    MockBoard board;
    // The ingestion service accepts the connection and never answers.
    board.http.mode = MockHttp::Mode::Hang;
    Supervisor supervisor(cfg, board.io());

    uint32_t now_ms = 0;
    for (; now_ms <= 7500; now_ms += cfg.tick_ms) {
        supervisor.tick(now_ms);
    }
    const TaskStatus& uplink = supervisor.task_status(TaskId::Uplink);
    const TaskStatus& sensor = supervisor.task_status(TaskId::Sensor);
    const TaskStatus& irrigation = supervisor.task_status(TaskId::Irrigation);
    const TaskStatus& display = supervisor.task_status(TaskId::Display);

    // One request outstanding, later cadences dropped rather than queued.
    assert(uplink.state == TaskState::Running);
    assert(uplink.runs == 1);
    assert(uplink.skipped_cycles == 7);
    assert(board.http.posts == 1);

    // Everything else kept its cadence.
    assert(sensor.runs == 8);
    assert(sensor.heartbeat.last_beat_ms == 7000);
    assert(display.heartbeat.last_beat_ms == 7500);
    assert(irrigation.heartbeat.last_beat_ms == 7500);
    assert(board.actuator.active);
    assert(board.sensors.channel_reads == 8 * static_cast<int>(kAnalogChannelCount));

    // The stuck request is eventually abandoned and the next one goes out.
    for (; now_ms <= 9000; now_ms += cfg.tick_ms) {
        supervisor.tick(now_ms);
    }
    assert(board.http.aborts == 1);
    assert(board.http.posts == 2);
    assert(supervisor.status().faults.active == ErrorCode::RemoteService);
    assert(sensor.heartbeat.last_beat_ms == 9000);

    // Sensor faults do not hold back the uplink either.
    board.http.mode = MockHttp::Mode::Respond;
    board.sensors.climate_ok = false;
    board.sensors.set_raw(AnalogChannel::Light, 9999);
    for (; now_ms <= 20000; now_ms += cfg.tick_ms) {
        supervisor.tick(now_ms);
    }
    assert(supervisor.context().uplink.sent > 0);
    assert(supervisor.task_status(TaskId::Sensor).last_outcome.error == ErrorCode::SensorLight);

    return 0;
}
