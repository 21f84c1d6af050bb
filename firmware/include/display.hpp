#pragma once

#include <cstddef>
#include <cstdint>
#include "config.hpp"
#include "connectivity.hpp"
#include "context.hpp"
#include "io_ports.hpp"

enum class DisplayView : uint8_t {
    Summary = 0,
    ChannelStatus,
    Network,
    Error,
};

constexpr std::size_t kRotatingViewCount = 3;

// Snapshot a view is rendered from.
struct ViewInput {
    SensorReading reading;
    ErrorCode error;
    uint32_t error_age_ms;
    ThresholdTable thresholds;
    LinkState link;
    bool time_synced;
    uint32_t clock_s;
    uint32_t uplinks_sent;
    uint32_t uplinks_failed;
    bool actuator_on;
};

ViewInput make_view_input(const DeviceContext& ctx, uint32_t now_ms);
DisplayView select_view(std::size_t rotation_index, ErrorCode error, uint32_t error_age_ms, uint32_t error_timeout_ms);
DisplayFrame render_view(DisplayView view, const ViewInput& in);

class DisplayPresenter : public ManagedTask {
public:
    DisplayPresenter();

    void start(DeviceContext& ctx, uint32_t now_ms) override;
    TaskOutcome step(DeviceContext& ctx, uint32_t now_ms) override;
    void abort(DeviceContext& ctx, uint32_t now_ms) override;

    DisplayView current_view() const { return view_; }
    uint32_t write_failures() const { return write_failures_; }

private:
    std::size_t rotation_index_;
    uint32_t last_rotation_ms_;
    DisplayView view_;
    DisplayFrame shown_;
    bool have_shown_;
    uint32_t write_failures_;
};
