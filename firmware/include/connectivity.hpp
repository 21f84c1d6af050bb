#pragma once

#include "config.hpp"
#include "io_ports.hpp"
#include <cstdint>

enum class LinkState : uint8_t {
    Disconnected = 0,
    Associating,
    Connected,
};

struct ConnectivityStatus {
    LinkState link;
    bool time_synced;
    bool time_sync_fault;
    uint32_t associations;
    uint32_t reassociations;
    uint32_t link_drops;
};

// Owns wireless association and the wall-clock offset. Serviced once per
// supervisor tick; every call returns without waiting on the radio.
class ConnectivityManager {
public:
    ConnectivityManager(const NetworkConfig& cfg, NetworkPort* port);

    void service(uint32_t now_ms);
    void request_reassociation(uint32_t now_ms);
    void request_time_sync(uint32_t now_ms);

    bool connected() const { return status_.link == LinkState::Connected; }
    bool time_synced() const { return status_.time_synced; }
    bool time_sync_fault() const { return status_.time_sync_fault; }
    // Synchronized epoch when available, else seconds since boot.
    uint32_t epoch_seconds(uint32_t now_ms) const;

    const ConnectivityStatus& status() const { return status_; }

private:
    void schedule_retry(uint32_t now_ms);
    void start_association(uint32_t now_ms);
    void on_associated(uint32_t now_ms);
    void poll_time(uint32_t now_ms);

    const NetworkConfig& cfg_;
    NetworkPort* port_;
    ConnectivityStatus status_;
    uint32_t deadline_ms_;
    uint32_t next_attempt_ms_;
    bool backoff_active_;
    uint32_t sync_started_ms_;
    bool sync_pending_;
    uint32_t sync_epoch_s_;
    uint32_t sync_ms_;
};

const char* link_state_name(LinkState state);
