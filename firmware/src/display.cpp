#include "display.hpp"
#include "logging.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstring>

namespace {
constexpr const char* kTag = "DISPLAY";

void set_line(DisplayFrame& frame, std::size_t row, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

// Lines are space padded to the full width so a cursor-positioned write
// always overwrites what the previous view left behind.
void set_line(DisplayFrame& frame, std::size_t row, const char* fmt, ...) {
    auto& line = frame.lines[row];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(line.data(), line.size(), fmt, args);
    va_end(args);
    std::size_t used = n < 0 ? 0 : static_cast<std::size_t>(n);
    if (used > kDisplayCols) {
        used = kDisplayCols;
    }
    std::memset(line.data() + used, ' ', kDisplayCols - used);
    line[kDisplayCols] = '\0';
}

DisplayFrame blank_frame() {
    DisplayFrame frame{};
    for (std::size_t row = 0; row < kDisplayRows; ++row) {
        set_line(frame, row, "%s", "");
    }
    return frame;
}

void render_summary(const ViewInput& in, DisplayFrame& f) {
    const SensorReading& r = in.reading;
    set_line(f, 0, "T:%.1fC H:%.0f%%", static_cast<double>(r.temperature), static_cast<double>(r.humidity));
    set_line(f, 1, "Soil:%d %s%s", r.soil_moisture,
             status_tier_name(classify(static_cast<float>(r.soil_moisture), in.thresholds.soil)),
             in.actuator_on ? " P" : "");
}

void render_channels(const ViewInput& in, DisplayFrame& f) {
    const SensorReading& r = in.reading;
    const ThresholdTable& t = in.thresholds;
    set_line(f, 0, "L:%s R:%s",
             status_tier_name(classify(static_cast<float>(r.light_level), t.light)),
             status_tier_name(classify(static_cast<float>(r.rain_level), t.rain)));
    set_line(f, 1, "A:%s S:%s",
             status_tier_name(classify(r.air_quality_ppm, t.air_quality_ppm)),
             status_tier_name(classify(static_cast<float>(r.soil_moisture), t.soil)));
}

void render_network(const ViewInput& in, DisplayFrame& f) {
    set_line(f, 0, "WiFi:%s Up:%lu/%lu", link_state_name(in.link),
             static_cast<unsigned long>(in.uplinks_sent), static_cast<unsigned long>(in.uplinks_failed));
    const uint32_t day_s = in.clock_s % 86400u;
    set_line(f, 1, "%02lu:%02lu:%02lu %s",
             static_cast<unsigned long>(day_s / 3600u),
             static_cast<unsigned long>((day_s / 60u) % 60u),
             static_cast<unsigned long>(day_s % 60u),
             in.time_synced ? "UTC" : "boot");
}

void render_error(const ViewInput& in, DisplayFrame& f) {
    set_line(f, 0, "!%s", error_code_name(in.error));
    set_line(f, 1, "active %lus", static_cast<unsigned long>(in.error_age_ms / 1000u));
}
} // namespace

ViewInput make_view_input(const DeviceContext& ctx, uint32_t now_ms) {
    ViewInput in{};
    in.reading = ctx.reading;
    in.error = ctx.faults.active_code();
    in.error_age_ms = ctx.faults.active_for_ms(now_ms);
    in.thresholds = ctx.cfg.thresholds;
    in.link = ctx.connectivity.status().link;
    in.time_synced = ctx.connectivity.time_synced();
    in.clock_s = ctx.connectivity.epoch_seconds(now_ms);
    in.uplinks_sent = ctx.uplink.sent;
    in.uplinks_failed = ctx.uplink.failed;
    in.actuator_on = ctx.irrigation.actuator_on;
    return in;
}

DisplayView select_view(std::size_t rotation_index, ErrorCode error, uint32_t error_age_ms, uint32_t error_timeout_ms) {
    if (error != ErrorCode::None && error_age_ms >= error_timeout_ms) {
        return DisplayView::Error;
    }
    return static_cast<DisplayView>(rotation_index % kRotatingViewCount);
}

DisplayFrame render_view(DisplayView view, const ViewInput& in) {
    DisplayFrame frame = blank_frame();
    switch (view) {
        case DisplayView::Summary: render_summary(in, frame); break;
        case DisplayView::ChannelStatus: render_channels(in, frame); break;
        case DisplayView::Network: render_network(in, frame); break;
        case DisplayView::Error: render_error(in, frame); break;
    }
    return frame;
}

DisplayPresenter::DisplayPresenter()
    : rotation_index_(0),
      last_rotation_ms_(0),
      view_(DisplayView::Summary),
      shown_{},
      have_shown_(false),
      write_failures_(0) {}

void DisplayPresenter::start(DeviceContext& ctx, uint32_t now_ms) {
    (void)ctx;
    if (!have_shown_) {
        last_rotation_ms_ = now_ms;
    }
}

TaskOutcome DisplayPresenter::step(DeviceContext& ctx, uint32_t now_ms) {
    if ((now_ms - last_rotation_ms_) >= ctx.cfg.display.rotation_ms) {
        rotation_index_ = (rotation_index_ + 1) % kRotatingViewCount;
        last_rotation_ms_ = now_ms;
    }
    const ViewInput in = make_view_input(ctx, now_ms);
    view_ = select_view(rotation_index_, in.error, in.error_age_ms, ctx.cfg.display.error_timeout_ms);
    const DisplayFrame frame = render_view(view_, in);
    if (have_shown_ && frame.lines == shown_.lines) {
        return completed();
    }
    if (!ctx.io.display->write_frame(frame)) {
        write_failures_++;
        log_warn(kTag, "frame write failed (%lu so far)", static_cast<unsigned long>(write_failures_));
        // Only this task's cycle fails; nothing is reported upward.
        return failed(ErrorCode::None);
    }
    shown_ = frame;
    have_shown_ = true;
    return completed();
}

void DisplayPresenter::abort(DeviceContext& ctx, uint32_t now_ms) {
    (void)ctx;
    (void)now_ms;
    have_shown_ = false;
}
