#include "uplink_encode.hpp"

#include <cassert>
#include <cmath>
#include <cstring>
#include <string>

int main() {
    char ts[kTimestampLen];
    assert(format_timestamp(0, ts, sizeof(ts)));
    assert(std::string(ts) == "1970-01-01 00:00:00");
    assert(format_timestamp(1700000000u, ts, sizeof(ts)));
    assert(std::string(ts) == "2023-11-14 22:13:20");
    char tiny[8];
    assert(!format_timestamp(1700000000u, tiny, sizeof(tiny)));

    SensorReading r{};
    r.temperature = 24.0f;
    r.humidity = 65.0f;
    r.light_level = 550;
    r.rain_level = 950;
    r.air_quality_raw = 300;
    r.air_quality_ppm = 12.5f;
    r.soil_moisture = 150;
    r.timestamp = 1700000000u;
    r.valid = true;

    EncodedPayload payload{};
    assert(encode_reading_json(r, payload));
    const std::string expected =
        "{\"timestamp\":\"2023-11-14 22:13:20\",\"temperature\":24.00,\"humidity\":65.00,"
        "\"lightLevel\":550,\"rainLevel\":950,\"airQualityPPM\":12.50,\"soilMoisture\":150}";
    assert(std::string(payload.bytes.data()) == expected);
    assert(payload.len == expected.size());
    assert(std::strlen(payload.bytes.data()) == payload.len);

    // Negative temperatures and the widest integers still fit.
    r.temperature = -39.95f;
    r.humidity = 100.0f;
    r.light_level = 1023;
    r.rain_level = 1023;
    r.soil_moisture = 1023;
    r.air_quality_ppm = 10000.0f;
    assert(encode_reading_json(r, payload));
    assert(std::string(payload.bytes.data()).find("\"airQualityPPM\":10000.00") != std::string::npos);
    assert(payload.len < kMaxPayloadLen);

    // Non-finite values are refused.
    r.humidity = NAN;
    assert(!encode_reading_json(r, payload));
    assert(payload.len == 0);
    r.humidity = 50.0f;
    r.temperature = INFINITY;
    assert(!encode_reading_json(r, payload));

    return 0;
}
