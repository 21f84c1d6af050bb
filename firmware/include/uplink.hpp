#pragma once

#include <cstdint>
#include "context.hpp"
#include "uplink_encode.hpp"

// Best-effort, most-recent-wins telemetry. One POST per Running episode; the
// request is polled on later steps until it completes or its deadline passes.
class UplinkTask : public ManagedTask {
public:
    UplinkTask();

    void start(DeviceContext& ctx, uint32_t now_ms) override;
    TaskOutcome step(DeviceContext& ctx, uint32_t now_ms) override;
    void abort(DeviceContext& ctx, uint32_t now_ms) override;

private:
    enum class Phase : uint8_t { Begin, InFlight };

    TaskOutcome begin(DeviceContext& ctx, uint32_t now_ms);
    TaskOutcome poll(DeviceContext& ctx, uint32_t now_ms);
    TaskOutcome fail_remote(DeviceContext& ctx, uint32_t now_ms);

    Phase phase_;
    uint32_t deadline_ms_;
    EncodedPayload payload_;
};
