#include "tasks.hpp"
#include "config.hpp"
#include "mock_io.hpp"

#include <cassert>
#include <cstddef>
#include <string>

namespace {
std::size_t nth_index(const EventLog& events, const std::string& what, int n) {
    int seen = 0;
    for (std::size_t i = 0; i < events.size(); ++i) {
        if (events[i] == what && ++seen == n) {
            return i;
        }
    }
    return events.size();
}
} // namespace

int main() {
    const DeviceConfig cfg = load_config();

    // Three rejected uploads in a row: a fresh association precedes the fourth.
    {
        MockBoard board;
        EventLog events;
        board.http.log = &events;
        board.network.log = &events;
        board.http.status_code = 500;
        Supervisor supervisor(cfg, board.io());

        for (uint32_t now_ms = 0; now_ms <= 3000; now_ms += cfg.tick_ms) {
            supervisor.tick(now_ms);
        }
        const DeviceContext& ctx = supervisor.context();
        assert(board.http.posts == 4);
        assert(ctx.uplink.failed == 3);
        assert(ctx.uplink.reassociation_requests == 1);
        assert(board.network.associations == 2);
        assert(board.network.disconnects == 1);
        const std::size_t fourth = nth_index(events, "http:post", 4);
        assert(fourth < events.size() && fourth > 0);
        assert(events[fourth - 1] == "net:associate");
        // Only the boot association precedes the first three posts.
        assert(nth_index(events, "net:associate", 1) < nth_index(events, "http:post", 1));
        assert(nth_index(events, "net:associate", 2) > nth_index(events, "http:post", 3));
        assert(supervisor.status().faults.active == ErrorCode::RemoteService);
        assert(board.http.last_url == cfg.uplink.url);
        assert(board.http.last_timeout_ms == cfg.uplink.timeout_ms);
        assert(board.http.last_body.find("\"soilMoisture\":150") != std::string::npos);
    }

    // A service that never answers is abandoned at the request deadline.
    {
        MockBoard board;
        board.http.mode = MockHttp::Mode::Hang;
        Supervisor supervisor(cfg, board.io());
        uint32_t now_ms = 0;
        for (; now_ms < cfg.uplink.timeout_ms; now_ms += cfg.tick_ms) {
            supervisor.tick(now_ms);
            assert(board.http.aborts == 0);
        }
        supervisor.tick(now_ms);
        assert(board.http.aborts == 1);
        assert(supervisor.context().uplink.failed == 1);
        assert(supervisor.task_status(TaskId::Uplink).last_outcome.error == ErrorCode::RemoteService);
        assert(supervisor.status().faults.active == ErrorCode::RemoteService);
        assert(supervisor.status().faults.counters.task_timeouts == 0);
    }

    // The supervisor's own deadline aborts an upload that outlives it.
    {
        DeviceConfig tight = load_config();
        tight.tasks[static_cast<std::size_t>(TaskId::Uplink)].timeout_ms = 3000;
        MockBoard board;
        board.http.mode = MockHttp::Mode::Hang;
        Supervisor supervisor(tight, board.io());
        for (uint32_t now_ms = 0; now_ms <= 3000; now_ms += tight.tick_ms) {
            supervisor.tick(now_ms);
        }
        assert(board.http.aborts == 1);
        assert(supervisor.status().faults.counters.task_timeouts == 1);
        assert(supervisor.task_status(TaskId::Uplink).state == TaskState::Idle);
        assert(supervisor.status().faults.active == ErrorCode::RemoteService);
    }

    // Transport errors and refused requests count the same as bad statuses.
    {
        MockBoard board;
        board.http.mode = MockHttp::Mode::TransportError;
        Supervisor supervisor(cfg, board.io());
        for (uint32_t now_ms = 0; now_ms <= 200; now_ms += cfg.tick_ms) {
            supervisor.tick(now_ms);
        }
        assert(supervisor.context().uplink.failed == 1);
        assert(supervisor.context().uplink.last_http_status == 0);

        board.http.mode = MockHttp::Mode::RefuseStart;
        for (uint32_t now_ms = 300; now_ms <= 1200; now_ms += cfg.tick_ms) {
            supervisor.tick(now_ms);
        }
        assert(supervisor.context().uplink.failed == 2);
    }

    // No link: nothing is posted and the failure is a connectivity error.
    {
        MockBoard board;
        board.network.associate_succeeds = false;
        Supervisor supervisor(cfg, board.io());
        supervisor.tick(0);
        assert(board.http.posts == 0);
        assert(supervisor.task_status(TaskId::Uplink).last_outcome.error == ErrorCode::Connectivity);
        assert(supervisor.status().faults.active == ErrorCode::Connectivity);
        assert(supervisor.context().uplink.failed == 0);
    }

    // A 2xx answer clears the remote-service error and the failure streak.
    {
        MockBoard board;
        board.http.status_code = 503;
        Supervisor supervisor(cfg, board.io());
        supervisor.tick(0);
        supervisor.tick(100);
        assert(supervisor.status().faults.active == ErrorCode::RemoteService);
        assert(supervisor.context().uplink.consecutive_failures == 1);
        board.http.status_code = 201;
        supervisor.tick(1000);
        supervisor.tick(1100);
        assert(supervisor.status().faults.active == ErrorCode::None);
        assert(supervisor.context().uplink.consecutive_failures == 0);
        assert(supervisor.context().uplink.sent == 1);
        assert(supervisor.context().uplink.last_http_status == 201);
    }

    return 0;
}
