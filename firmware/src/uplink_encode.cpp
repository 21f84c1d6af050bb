#include "uplink_encode.hpp"
#include <cmath>
#include <cstdio>
#include <ctime>

bool format_timestamp(uint32_t epoch_s, char* out, std::size_t out_len) {
    if (out == nullptr || out_len < kTimestampLen) {
        return false;
    }
    const std::time_t t = static_cast<std::time_t>(epoch_s);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) {
        return false;
    }
    return std::strftime(out, out_len, "%Y-%m-%d %H:%M:%S", &tm) == kTimestampLen - 1;
}

bool encode_reading_json(const SensorReading& reading, EncodedPayload& out) {
    out.len = 0;
    if (!std::isfinite(reading.temperature) || !std::isfinite(reading.humidity) ||
        !std::isfinite(reading.air_quality_ppm)) {
        return false;
    }
    char ts[kTimestampLen];
    if (!format_timestamp(reading.timestamp, ts, sizeof(ts))) {
        return false;
    }
    const int n = std::snprintf(out.bytes.data(), out.bytes.size(),
        "{\"timestamp\":\"%s\",\"temperature\":%.2f,\"humidity\":%.2f,"
        "\"lightLevel\":%d,\"rainLevel\":%d,\"airQualityPPM\":%.2f,\"soilMoisture\":%d}",
        ts,
        static_cast<double>(reading.temperature),
        static_cast<double>(reading.humidity),
        reading.light_level,
        reading.rain_level,
        static_cast<double>(reading.air_quality_ppm),
        reading.soil_moisture);
    if (n <= 0 || static_cast<std::size_t>(n) >= out.bytes.size()) {
        return false;
    }
    out.len = static_cast<std::size_t>(n);
    return true;
}
