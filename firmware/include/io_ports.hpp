#pragma once

#include "telemetry.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

constexpr std::size_t kDisplayRows = 2;
constexpr std::size_t kDisplayCols = 16;

struct DisplayFrame {
    std::array<std::array<char, kDisplayCols + 1>, kDisplayRows> lines;
};

enum class HttpPoll : uint8_t {
    InFlight,
    Done,
    Error,
};

// Hardware seams. Each step function reaches the outside world only through
// these; ESP-IDF, host simulation and test mocks provide implementations.
class SensorPort {
public:
    virtual ~SensorPort() = default;
    // Single bounded read of the combined temperature/humidity probe.
    virtual bool read_climate(float& temperature_c, float& humidity_pct) = 0;
    // Raw 10-bit reading; values outside [0, 1023] signal a channel fault.
    virtual int read_channel(AnalogChannel ch) = 0;
};

class ActuatorPort {
public:
    virtual ~ActuatorPort() = default;
    virtual bool set_active(bool on) = 0;
};

class HttpPort {
public:
    virtual ~HttpPort() = default;
    virtual bool begin_post(const char* url, const char* body, uint32_t timeout_ms) = 0;
    // Non-blocking. On Done, status holds the HTTP status code.
    virtual HttpPoll poll(int& status) = 0;
    virtual void abort() = 0;
};

class NetworkPort {
public:
    virtual ~NetworkPort() = default;
    virtual bool begin_association() = 0;
    virtual void disconnect() = 0;
    virtual bool is_associated() = 0;
    virtual bool start_time_sync() = 0;
    virtual bool poll_time(uint32_t& epoch_s) = 0;
};

class DisplayPort {
public:
    virtual ~DisplayPort() = default;
    virtual bool write_frame(const DisplayFrame& frame) = 0;
};

struct DeviceIo {
    SensorPort* sensors;
    ActuatorPort* actuator;
    HttpPort* http;
    NetworkPort* network;
    DisplayPort* display;
};
