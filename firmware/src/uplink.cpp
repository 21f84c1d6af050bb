#include "uplink.hpp"
#include "logging.hpp"

namespace {
constexpr const char* kTag = "UPLINK";
} // namespace

UplinkTask::UplinkTask() : phase_(Phase::Begin), deadline_ms_(0), payload_{} {}

void UplinkTask::start(DeviceContext& ctx, uint32_t now_ms) {
    (void)ctx;
    (void)now_ms;
    phase_ = Phase::Begin;
}

TaskOutcome UplinkTask::step(DeviceContext& ctx, uint32_t now_ms) {
    if (phase_ == Phase::Begin) {
        return begin(ctx, now_ms);
    }
    return poll(ctx, now_ms);
}

void UplinkTask::abort(DeviceContext& ctx, uint32_t now_ms) {
    if (phase_ == Phase::InFlight) {
        ctx.io.http->abort();
        fail_remote(ctx, now_ms);
    }
    phase_ = Phase::Begin;
}

TaskOutcome UplinkTask::begin(DeviceContext& ctx, uint32_t now_ms) {
    if (!ctx.connectivity.connected()) {
        log_debug(kTag, "no link, upload skipped");
        return failed(ErrorCode::Connectivity);
    }
    if (!encode_reading_json(ctx.reading, payload_)) {
        log_error(kTag, "reading could not be serialized");
        return fail_remote(ctx, now_ms);
    }
    const UplinkConfig& cfg = ctx.cfg.uplink;
    if (!ctx.io.http->begin_post(cfg.url.c_str(), payload_.bytes.data(), cfg.timeout_ms)) {
        log_warn(kTag, "POST to %s could not be started", cfg.url.c_str());
        return fail_remote(ctx, now_ms);
    }
    deadline_ms_ = now_ms + cfg.timeout_ms;
    phase_ = Phase::InFlight;
    log_debug(kTag, "POST %u bytes", static_cast<unsigned>(payload_.len));
    return running();
}

TaskOutcome UplinkTask::poll(DeviceContext& ctx, uint32_t now_ms) {
    int status = 0;
    const HttpPoll result = ctx.io.http->poll(status);
    if (result == HttpPoll::InFlight) {
        if (static_cast<int32_t>(now_ms - deadline_ms_) < 0) {
            return running();
        }
        log_warn(kTag, "no response within %lu ms", static_cast<unsigned long>(ctx.cfg.uplink.timeout_ms));
        ctx.io.http->abort();
        ctx.uplink.last_http_status = 0;
        return fail_remote(ctx, now_ms);
    }
    phase_ = Phase::Begin;
    if (result == HttpPoll::Error) {
        log_warn(kTag, "transport error");
        ctx.uplink.last_http_status = 0;
        return fail_remote(ctx, now_ms);
    }
    ctx.uplink.last_http_status = status;
    if (status < 200 || status >= 300) {
        log_warn(kTag, "ingestion service answered %d", status);
        return fail_remote(ctx, now_ms);
    }
    ctx.uplink.sent++;
    ctx.uplink.consecutive_failures = 0;
    return completed();
}

TaskOutcome UplinkTask::fail_remote(DeviceContext& ctx, uint32_t now_ms) {
    phase_ = Phase::Begin;
    ctx.uplink.failed++;
    ctx.uplink.consecutive_failures++;
    if (ctx.uplink.consecutive_failures >= ctx.cfg.uplink.failure_limit) {
        log_warn(kTag, "%lu consecutive failures, requesting fresh association",
                 static_cast<unsigned long>(ctx.uplink.consecutive_failures));
        ctx.uplink.reassociation_requests++;
        ctx.uplink.consecutive_failures = 0;
        ctx.connectivity.request_reassociation(now_ms);
    }
    return failed(ErrorCode::RemoteService);
}
