#pragma once

#include "telemetry.hpp"
#include <array>
#include <cstddef>
#include <cstdint>

constexpr std::size_t kMaxPayloadLen = 256;
constexpr std::size_t kTimestampLen = 20; // "YYYY-MM-DD HH:MM:SS" + NUL

struct EncodedPayload {
    std::array<char, kMaxPayloadLen> bytes;
    std::size_t len;
};

// UTC "YYYY-MM-DD HH:MM:SS".
bool format_timestamp(uint32_t epoch_s, char* out, std::size_t out_len);
// JSON object accepted by the ingestion service's insert endpoint. Fails on
// non-finite numbers, which the service would reject anyway.
bool encode_reading_json(const SensorReading& reading, EncodedPayload& out);
