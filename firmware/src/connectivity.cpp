#include "connectivity.hpp"
#include "logging.hpp"

namespace {
constexpr const char* kTag = "NET";

bool reached(uint32_t now_ms, uint32_t deadline_ms) {
    return static_cast<int32_t>(now_ms - deadline_ms) >= 0;
}
} // namespace

ConnectivityManager::ConnectivityManager(const NetworkConfig& cfg, NetworkPort* port)
    : cfg_(cfg),
      port_(port),
      status_{LinkState::Disconnected, false, false, 0, 0, 0},
      deadline_ms_(0),
      next_attempt_ms_(0),
      backoff_active_(false),
      sync_started_ms_(0),
      sync_pending_(false),
      sync_epoch_s_(0),
      sync_ms_(0) {}

void ConnectivityManager::service(uint32_t now_ms) {
    if (port_ == nullptr) {
        return;
    }
    switch (status_.link) {
        case LinkState::Disconnected:
            if (!backoff_active_ || reached(now_ms, next_attempt_ms_)) {
                start_association(now_ms);
            }
            break;
        case LinkState::Associating:
            if (port_->is_associated()) {
                on_associated(now_ms);
            } else if (reached(now_ms, deadline_ms_)) {
                log_warn(kTag, "association timed out after %lu ms", static_cast<unsigned long>(cfg_.associate_timeout_ms));
                port_->disconnect();
                status_.link = LinkState::Disconnected;
                schedule_retry(now_ms);
            }
            break;
        case LinkState::Connected:
            if (!port_->is_associated()) {
                log_warn(kTag, "link dropped");
                status_.link = LinkState::Disconnected;
                status_.link_drops++;
                schedule_retry(now_ms);
                break;
            }
            poll_time(now_ms);
            break;
    }
}

void ConnectivityManager::request_reassociation(uint32_t now_ms) {
    if (port_ == nullptr) {
        return;
    }
    log_info(kTag, "fresh association requested");
    status_.reassociations++;
    port_->disconnect();
    status_.link = LinkState::Disconnected;
    start_association(now_ms);
}

void ConnectivityManager::request_time_sync(uint32_t now_ms) {
    if (port_ == nullptr || !connected()) {
        return;
    }
    if (!port_->start_time_sync()) {
        log_warn(kTag, "time sync could not be started");
    }
    sync_pending_ = true;
    sync_started_ms_ = now_ms;
}

uint32_t ConnectivityManager::epoch_seconds(uint32_t now_ms) const {
    if (!status_.time_synced) {
        return now_ms / 1000u;
    }
    // Elapsed time since the sync is wrap-safe; the uptime itself is not.
    return sync_epoch_s_ + (now_ms - sync_ms_) / 1000u;
}

void ConnectivityManager::schedule_retry(uint32_t now_ms) {
    next_attempt_ms_ = now_ms + cfg_.reconnect_backoff_ms;
    backoff_active_ = true;
}

void ConnectivityManager::start_association(uint32_t now_ms) {
    backoff_active_ = false;
    status_.associations++;
    deadline_ms_ = now_ms + cfg_.associate_timeout_ms;
    if (!port_->begin_association()) {
        log_warn(kTag, "association could not be started");
        status_.link = LinkState::Disconnected;
        schedule_retry(now_ms);
        return;
    }
    status_.link = LinkState::Associating;
    // Some ports associate synchronously (simulation, mocks).
    if (port_->is_associated()) {
        on_associated(now_ms);
    }
}

void ConnectivityManager::on_associated(uint32_t now_ms) {
    status_.link = LinkState::Connected;
    log_info(kTag, "associated with %s", cfg_.ssid.c_str());
    if (!status_.time_synced) {
        request_time_sync(now_ms);
        poll_time(now_ms);
    }
}

void ConnectivityManager::poll_time(uint32_t now_ms) {
    if (!sync_pending_) {
        return;
    }
    uint32_t epoch_s = 0;
    if (port_->poll_time(epoch_s)) {
        sync_epoch_s_ = epoch_s;
        sync_ms_ = now_ms;
        status_.time_synced = true;
        status_.time_sync_fault = false;
        sync_pending_ = false;
        log_info(kTag, "time synchronized (epoch=%lu)", static_cast<unsigned long>(epoch_s));
        return;
    }
    if (!status_.time_sync_fault && (now_ms - sync_started_ms_) >= cfg_.time_sync_timeout_ms) {
        log_warn(kTag, "time sync not complete after %lu ms", static_cast<unsigned long>(cfg_.time_sync_timeout_ms));
        status_.time_sync_fault = true;
    }
}

const char* link_state_name(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "DOWN";
        case LinkState::Associating: return "JOIN";
        case LinkState::Connected: return "OK";
    }
    return "?";
}
