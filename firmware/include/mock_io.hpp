#pragma once

#include "io_ports.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

// In-memory port doubles for host tests. Every mock can append to a shared
// event log so tests can assert on the relative order of side effects.
using EventLog = std::vector<std::string>;

class MockSensors : public SensorPort {
public:
    bool read_climate(float& temperature_c, float& humidity_pct) override {
        climate_reads++;
        if (climate_failures > 0) {
            climate_failures--;
            return false;
        }
        if (!climate_ok) {
            return false;
        }
        temperature_c = temperature;
        humidity_pct = humidity;
        return true;
    }

    int read_channel(AnalogChannel ch) override {
        channel_reads++;
        return raw[static_cast<std::size_t>(ch)];
    }

    void set_raw(AnalogChannel ch, int value) { raw[static_cast<std::size_t>(ch)] = value; }

    float temperature = 24.0f;
    float humidity = 65.0f;
    bool climate_ok = true;
    int climate_failures = 0;
    std::array<int, kAnalogChannelCount> raw{{550, 950, 300, 150}};
    int climate_reads = 0;
    int channel_reads = 0;
};

class MockActuator : public ActuatorPort {
public:
    bool set_active(bool on) override {
        set_calls++;
        if (fail_writes) {
            return false;
        }
        if (on && !active) {
            activations++;
        }
        active = on;
        if (log) log->push_back(on ? "actuator:on" : "actuator:off");
        return true;
    }

    bool active = false;
    bool fail_writes = false;
    int activations = 0;
    int set_calls = 0;
    EventLog* log = nullptr;
};

class MockHttp : public HttpPort {
public:
    enum class Mode { Respond, Hang, TransportError, RefuseStart };

    bool begin_post(const char* url, const char* body, uint32_t timeout_ms) override {
        posts++;
        last_url = url;
        last_body = body;
        last_timeout_ms = timeout_ms;
        if (log) log->push_back("http:post");
        if (mode == Mode::RefuseStart) {
            return false;
        }
        in_flight = true;
        polls_left = latency_polls;
        return true;
    }

    HttpPoll poll(int& status) override {
        if (!in_flight) {
            return HttpPoll::Error;
        }
        if (mode == Mode::Hang) {
            return HttpPoll::InFlight;
        }
        if (polls_left > 0) {
            polls_left--;
            return HttpPoll::InFlight;
        }
        in_flight = false;
        if (mode == Mode::TransportError) {
            return HttpPoll::Error;
        }
        status = status_code;
        return HttpPoll::Done;
    }

    void abort() override {
        aborts++;
        in_flight = false;
    }

    Mode mode = Mode::Respond;
    int status_code = 200;
    int latency_polls = 0;
    int polls_left = 0;
    bool in_flight = false;
    int posts = 0;
    int aborts = 0;
    uint32_t last_timeout_ms = 0;
    std::string last_url;
    std::string last_body;
    EventLog* log = nullptr;
};

class MockNetwork : public NetworkPort {
public:
    bool begin_association() override {
        associations++;
        if (log) log->push_back("net:associate");
        if (associate_succeeds) {
            associated = true;
        }
        return true;
    }

    void disconnect() override {
        disconnects++;
        associated = false;
    }

    bool is_associated() override { return associated; }

    bool start_time_sync() override {
        time_sync_starts++;
        return true;
    }

    bool poll_time(uint32_t& epoch_s) override {
        if (!time_available) {
            return false;
        }
        epoch_s = epoch;
        return true;
    }

    bool associated = false;
    bool associate_succeeds = true;
    bool time_available = true;
    uint32_t epoch = 1700000000u;
    int associations = 0;
    int disconnects = 0;
    int time_sync_starts = 0;
    EventLog* log = nullptr;
};

class MockDisplay : public DisplayPort {
public:
    bool write_frame(const DisplayFrame& frame) override {
        writes++;
        if (fail_writes) {
            return false;
        }
        last = frame;
        return true;
    }

    std::string line(std::size_t row) const { return std::string(last.lines[row].data()); }

    DisplayFrame last{};
    bool fail_writes = false;
    int writes = 0;
};

struct MockBoard {
    MockSensors sensors;
    MockActuator actuator;
    MockHttp http;
    MockNetwork network;
    MockDisplay display;

    DeviceIo io() { return {&sensors, &actuator, &http, &network, &display}; }
};
