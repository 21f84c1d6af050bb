#include "connectivity.hpp"
#include "config.hpp"
#include "mock_io.hpp"

#include <cassert>
#include <string>

int main() {
    const DeviceConfig cfg = load_config();
    const NetworkConfig& net = cfg.network;

    // Access point out of range: the attempt times out and backs off.
    {
        MockNetwork port;
        port.associate_succeeds = false;
        ConnectivityManager conn(net, &port);
        conn.service(0);
        assert(conn.status().link == LinkState::Associating);
        assert(port.associations == 1);
        conn.service(net.associate_timeout_ms - 1);
        assert(conn.status().link == LinkState::Associating);
        conn.service(net.associate_timeout_ms);
        assert(conn.status().link == LinkState::Disconnected);
        assert(port.disconnects == 1);
        conn.service(net.associate_timeout_ms + net.reconnect_backoff_ms - 1);
        assert(port.associations == 1);

        // In range again.
        port.associate_succeeds = true;
        const uint32_t t = net.associate_timeout_ms + net.reconnect_backoff_ms;
        conn.service(t);
        assert(port.associations == 2);
        assert(conn.connected());
        assert(conn.time_synced());
        assert(conn.epoch_seconds(t) == port.epoch);
        assert(conn.epoch_seconds(t + 61000) == port.epoch + 61);
        assert(conn.status().associations == 2);
    }

    // Association completing asynchronously is noticed on a later service.
    {
        MockNetwork port;
        port.associate_succeeds = false;
        ConnectivityManager conn(net, &port);
        conn.service(0);
        port.associated = true;
        conn.service(100);
        assert(conn.connected());
        assert(port.time_sync_starts == 1);
    }

    // Link loss is counted and reconnected after the backoff.
    {
        MockNetwork port;
        ConnectivityManager conn(net, &port);
        conn.service(0);
        assert(conn.connected());
        port.associated = false;
        conn.service(1000);
        assert(!conn.connected());
        assert(conn.status().link_drops == 1);
        conn.service(1000 + net.reconnect_backoff_ms);
        assert(conn.connected());
        // The wall clock survives a reconnect.
        assert(conn.time_synced());
        assert(port.time_sync_starts == 1);

        conn.request_reassociation(9000);
        assert(conn.status().reassociations == 1);
        assert(port.disconnects == 1);
        assert(port.associations == 3);
        assert(conn.connected());
    }

    // No time source: uptime seconds until the sync fault is raised.
    {
        MockNetwork port;
        port.time_available = false;
        ConnectivityManager conn(net, &port);
        conn.service(0);
        assert(conn.connected());
        assert(!conn.time_synced());
        assert(conn.epoch_seconds(42000) == 42);
        conn.service(net.time_sync_timeout_ms - 100);
        assert(!conn.time_sync_fault());
        conn.service(net.time_sync_timeout_ms);
        assert(conn.time_sync_fault());
        port.time_available = true;
        conn.service(net.time_sync_timeout_ms + 100);
        assert(!conn.time_sync_fault());
        assert(conn.time_synced());
    }

    assert(std::string(link_state_name(LinkState::Connected)) == "OK");
    assert(std::string(link_state_name(LinkState::Disconnected)) == "DOWN");
    return 0;
}
