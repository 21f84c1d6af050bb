#include "board_io.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cstring>
#include <string>

#ifdef ESP_PLATFORM
#include "driver/gpio.h"
#include "esp_adc/adc_oneshot.h"
#include "esp_err.h"
#include "esp_event.h"
#include "esp_http_client.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_rom_sys.h"
#include "esp_sntp.h"
#include "esp_timer.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include <ctime>
#else
#include <ctime>
#include <random>
#endif

namespace {
#ifdef ESP_PLATFORM
constexpr adc_unit_t kAdcUnit = ADC_UNIT_1;
// Adjust per board. Order follows AnalogChannel.
constexpr adc_channel_t kAdcChannels[kAnalogChannelCount] = {
    ADC_CHANNEL_6, // light (GPIO34)
    ADC_CHANNEL_7, // rain (GPIO35)
    ADC_CHANNEL_0, // air quality (GPIO36)
    ADC_CHANNEL_3, // soil (GPIO39)
};
constexpr gpio_num_t kClimatePin = GPIO_NUM_4;
constexpr gpio_num_t kPumpPin = GPIO_NUM_26;
constexpr int64_t kDhtBitTimeoutUs = 100;

bool check_esp(esp_err_t err, const char* msg) {
    if (err != ESP_OK) {
        ESP_LOGE("BOARD", "%s failed: %s", msg, esp_err_to_name(err));
        return false;
    }
    return true;
}

class EspSensors : public SensorPort {
public:
    bool init() {
        adc_oneshot_unit_init_cfg_t unit_cfg = {};
        unit_cfg.unit_id = kAdcUnit;
        unit_cfg.ulp_mode = ADC_ULP_MODE_DISABLE;
        if (!check_esp(adc_oneshot_new_unit(&unit_cfg, &unit_), "adc_oneshot_new_unit")) {
            return false;
        }
        adc_oneshot_chan_cfg_t chan_cfg = {};
        chan_cfg.bitwidth = ADC_BITWIDTH_12;
        chan_cfg.atten = ADC_ATTEN_DB_12;
        for (adc_channel_t ch : kAdcChannels) {
            if (!check_esp(adc_oneshot_config_channel(unit_, ch, &chan_cfg), "adc_oneshot_config_channel")) {
                return false;
            }
        }
        gpio_reset_pin(kClimatePin);
        gpio_set_pull_mode(kClimatePin, GPIO_PULLUP_ONLY);
        ready_ = true;
        ESP_LOGI("BOARD", "ADC oneshot ready (unit=%d, %u channels)", static_cast<int>(kAdcUnit),
                 static_cast<unsigned>(kAnalogChannelCount));
        return true;
    }

    int read_channel(AnalogChannel ch) override {
        if (!ready_) {
            return -1;
        }
        int raw = 0;
        const esp_err_t err = adc_oneshot_read(unit_, kAdcChannels[static_cast<std::size_t>(ch)], &raw);
        if (err != ESP_OK) {
            ESP_LOGW("BOARD", "adc_oneshot_read(%s) failed: %s", channel_name(ch), esp_err_to_name(err));
            return -1;
        }
        // 12-bit conversion scaled to the 10-bit range the thresholds use.
        return std::clamp(raw, 0, 4095) >> 2;
    }

    // Single-wire DHT22 transaction: ~5 ms with interrupts briefly masked.
    bool read_climate(float& temperature_c, float& humidity_pct) override {
        uint8_t data[5] = {0, 0, 0, 0, 0};
        gpio_set_direction(kClimatePin, GPIO_MODE_OUTPUT);
        gpio_set_level(kClimatePin, 0);
        esp_rom_delay_us(1200);
        gpio_set_level(kClimatePin, 1);
        esp_rom_delay_us(30);
        gpio_set_direction(kClimatePin, GPIO_MODE_INPUT);

        portDISABLE_INTERRUPTS();
        bool ok = wait_level(0) >= 0 && wait_level(1) >= 0 && wait_level(0) >= 0;
        for (int bit = 0; ok && bit < 40; ++bit) {
            if (wait_level(1) < 0) {
                ok = false;
                break;
            }
            const int64_t high_us = wait_level(0);
            if (high_us < 0) {
                ok = false;
                break;
            }
            data[bit / 8] <<= 1;
            if (high_us > 40) {
                data[bit / 8] |= 1;
            }
        }
        portENABLE_INTERRUPTS();

        if (!ok) {
            return false;
        }
        const uint8_t sum = static_cast<uint8_t>(data[0] + data[1] + data[2] + data[3]);
        if (sum != data[4]) {
            ESP_LOGW("BOARD", "climate probe checksum mismatch");
            return false;
        }
        humidity_pct = static_cast<float>((data[0] << 8) | data[1]) / 10.0f;
        const int raw_t = ((data[2] & 0x7F) << 8) | data[3];
        temperature_c = static_cast<float>(raw_t) / 10.0f;
        if (data[2] & 0x80) {
            temperature_c = -temperature_c;
        }
        return true;
    }

private:
    // Waits while the line sits at `level`; returns how long it stayed there.
    int64_t wait_level(int level) {
        const int64_t start = esp_timer_get_time();
        while (gpio_get_level(kClimatePin) == level) {
            if (esp_timer_get_time() - start > kDhtBitTimeoutUs) {
                return -1;
            }
        }
        return esp_timer_get_time() - start;
    }

    adc_oneshot_unit_handle_t unit_ = nullptr;
    bool ready_ = false;
};

class EspActuator : public ActuatorPort {
public:
    bool init() {
        gpio_config_t io = {};
        io.pin_bit_mask = 1ULL << kPumpPin;
        io.mode = GPIO_MODE_OUTPUT;
        io.pull_up_en = GPIO_PULLUP_DISABLE;
        io.pull_down_en = GPIO_PULLDOWN_ENABLE;
        io.intr_type = GPIO_INTR_DISABLE;
        if (!check_esp(gpio_config(&io), "gpio_config(pump)")) {
            return false;
        }
        ready_ = check_esp(gpio_set_level(kPumpPin, 0), "gpio_set_level(pump)");
        return ready_;
    }

    bool set_active(bool on) override {
        if (!ready_) {
            return false;
        }
        return check_esp(gpio_set_level(kPumpPin, on ? 1 : 0), "gpio_set_level(pump)");
    }

private:
    bool ready_ = false;
};

class EspNetwork : public NetworkPort {
public:
    bool init(const NetworkConfig& cfg) {
        if (!check_esp(esp_netif_init(), "esp_netif_init")) return false;
        const esp_err_t loop_err = esp_event_loop_create_default();
        if (loop_err != ESP_ERR_INVALID_STATE && !check_esp(loop_err, "esp_event_loop_create_default")) return false;
        esp_netif_create_default_wifi_sta();

        wifi_init_config_t init_cfg = WIFI_INIT_CONFIG_DEFAULT();
        if (!check_esp(esp_wifi_init(&init_cfg), "esp_wifi_init")) return false;
        if (!check_esp(esp_wifi_set_storage(WIFI_STORAGE_RAM), "esp_wifi_set_storage")) return false;
        if (!check_esp(esp_wifi_set_mode(WIFI_MODE_STA), "esp_wifi_set_mode")) return false;

        wifi_config_t sta = {};
        std::strncpy(reinterpret_cast<char*>(sta.sta.ssid), cfg.ssid.c_str(), sizeof(sta.sta.ssid) - 1);
        std::strncpy(reinterpret_cast<char*>(sta.sta.password), cfg.password.c_str(), sizeof(sta.sta.password) - 1);
        if (!check_esp(esp_wifi_set_config(WIFI_IF_STA, &sta), "esp_wifi_set_config")) return false;

        if (!check_esp(esp_event_handler_register(WIFI_EVENT, WIFI_EVENT_STA_DISCONNECTED, &EspNetwork::on_event, this),
                       "esp_event_handler_register(wifi)")) return false;
        if (!check_esp(esp_event_handler_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &EspNetwork::on_event, this),
                       "esp_event_handler_register(ip)")) return false;
        if (!check_esp(esp_wifi_start(), "esp_wifi_start")) return false;

        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        esp_sntp_setservername(0, cfg.ntp_server.c_str());
        ready_ = true;
        ESP_LOGI("BOARD", "WiFi station ready (ssid=%s)", cfg.ssid.c_str());
        return true;
    }

    bool begin_association() override {
        if (!ready_) {
            return false;
        }
        associated_ = false;
        return check_esp(esp_wifi_connect(), "esp_wifi_connect");
    }

    void disconnect() override {
        associated_ = false;
        if (ready_) {
            const esp_err_t err = esp_wifi_disconnect();
            if (err != ESP_OK && err != ESP_ERR_WIFI_NOT_STARTED) {
                ESP_LOGW("BOARD", "esp_wifi_disconnect failed: %s", esp_err_to_name(err));
            }
        }
    }

    bool is_associated() override { return associated_; }

    bool start_time_sync() override {
        if (!ready_) {
            return false;
        }
        if (esp_sntp_enabled()) {
            esp_sntp_restart();
        } else {
            esp_sntp_init();
        }
        return true;
    }

    bool poll_time(uint32_t& epoch_s) override {
        if (sntp_get_sync_status() != SNTP_SYNC_STATUS_COMPLETED) {
            return false;
        }
        const std::time_t now = std::time(nullptr);
        if (now <= 0) {
            return false;
        }
        epoch_s = static_cast<uint32_t>(now);
        return true;
    }

private:
    static void on_event(void* arg, esp_event_base_t base, int32_t id, void* data) {
        (void)data;
        auto* self = static_cast<EspNetwork*>(arg);
        if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP) {
            self->associated_ = true;
        } else if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED) {
            self->associated_ = false;
        }
    }

    volatile bool associated_ = false;
    bool ready_ = false;
};

// esp_http_client in async mode: perform() returns ESP_ERR_HTTP_EAGAIN until
// the exchange finishes, so each poll costs one socket check.
class EspHttp : public HttpPort {
public:
    bool begin_post(const char* url, const char* body, uint32_t timeout_ms) override {
        abort();
        body_ = body;
        esp_http_client_config_t cfg = {};
        cfg.url = url;
        cfg.method = HTTP_METHOD_POST;
        cfg.timeout_ms = static_cast<int>(timeout_ms);
        cfg.is_async = true;
        client_ = esp_http_client_init(&cfg);
        if (client_ == nullptr) {
            ESP_LOGE("BOARD", "esp_http_client_init failed");
            return false;
        }
        if (!check_esp(esp_http_client_set_header(client_, "Content-Type", "application/json"), "esp_http_client_set_header") ||
            !check_esp(esp_http_client_set_post_field(client_, body_.c_str(), static_cast<int>(body_.size())),
                       "esp_http_client_set_post_field")) {
            abort();
            return false;
        }
        return true;
    }

    HttpPoll poll(int& status) override {
        if (client_ == nullptr) {
            return HttpPoll::Error;
        }
        const esp_err_t err = esp_http_client_perform(client_);
        if (err == ESP_ERR_HTTP_EAGAIN) {
            return HttpPoll::InFlight;
        }
        if (err != ESP_OK) {
            ESP_LOGW("BOARD", "esp_http_client_perform failed: %s", esp_err_to_name(err));
            abort();
            return HttpPoll::Error;
        }
        status = esp_http_client_get_status_code(client_);
        abort();
        return HttpPoll::Done;
    }

    void abort() override {
        if (client_ != nullptr) {
            esp_http_client_cleanup(client_);
            client_ = nullptr;
        }
    }

private:
    esp_http_client_handle_t client_ = nullptr;
    std::string body_;
};

// The character LCD protocol is board specific; frames go to the log.
class EspDisplay : public DisplayPort {
public:
    bool write_frame(const DisplayFrame& frame) override {
        ESP_LOGI("LCD", "|%s|%s|", frame.lines[0].data(), frame.lines[1].data());
        return true;
    }
};

EspSensors g_sensors;
EspActuator g_actuator;
EspNetwork g_network;
EspHttp g_http;
EspDisplay g_display;
#else
constexpr const char* kTag = "SIM";

class SimActuator : public ActuatorPort {
public:
    bool set_active(bool on) override {
        if (on != active) {
            log_info(kTag, "pump %s", on ? "ON" : "OFF");
        }
        active = on;
        return true;
    }

    bool active = false;
};

// Soil dries by one count per read and recovers quickly under irrigation.
class SimSensors : public SensorPort {
public:
    explicit SimSensors(const SimActuator& pump) : pump_(pump), rng_(42) {}

    bool read_climate(float& temperature_c, float& humidity_pct) override {
        std::normal_distribution<float> noise(0.0f, 0.3f);
        temperature_c = 23.5f + noise(rng_);
        humidity_pct = 58.0f + noise(rng_) * 4.0f;
        return true;
    }

    int read_channel(AnalogChannel ch) override {
        std::uniform_int_distribution<int> jitter(-6, 6);
        switch (ch) {
            case AnalogChannel::Light: return 620 + jitter(rng_);
            case AnalogChannel::Rain: return 960 + jitter(rng_);
            case AnalogChannel::AirQuality: return 310 + jitter(rng_);
            case AnalogChannel::Soil:
            default:
                soil_ = pump_.active ? std::min(soil_ + 25, 700) : std::max(soil_ - 1, 120);
                return soil_;
        }
    }

private:
    const SimActuator& pump_;
    std::mt19937 rng_;
    int soil_ = 215;
};

class SimNetwork : public NetworkPort {
public:
    bool begin_association() override {
        associated_ = true;
        return true;
    }
    void disconnect() override { associated_ = false; }
    bool is_associated() override { return associated_; }
    bool start_time_sync() override { return true; }
    bool poll_time(uint32_t& epoch_s) override {
        epoch_s = static_cast<uint32_t>(std::time(nullptr));
        return true;
    }

private:
    bool associated_ = false;
};

// Answers 201 after one poll, like the ingestion service's insert endpoint.
class SimHttp : public HttpPort {
public:
    bool begin_post(const char* url, const char* body, uint32_t timeout_ms) override {
        (void)timeout_ms;
        log_debug(kTag, "POST %s %s", url, body);
        polls_left_ = 1;
        in_flight_ = true;
        return true;
    }
    HttpPoll poll(int& status) override {
        if (!in_flight_) {
            return HttpPoll::Error;
        }
        if (polls_left_-- > 0) {
            return HttpPoll::InFlight;
        }
        in_flight_ = false;
        status = 201;
        return HttpPoll::Done;
    }
    void abort() override { in_flight_ = false; }

private:
    int polls_left_ = 0;
    bool in_flight_ = false;
};

class SimDisplay : public DisplayPort {
public:
    bool write_frame(const DisplayFrame& frame) override {
        log_info("LCD", "|%s|%s|", frame.lines[0].data(), frame.lines[1].data());
        return true;
    }
};

SimActuator g_actuator;
SimSensors g_sensors(g_actuator);
SimNetwork g_network;
SimHttp g_http;
SimDisplay g_display;
#endif
} // namespace

DeviceIo init_board_io(const DeviceConfig& cfg) {
#ifdef ESP_PLATFORM
    // Failures leave the port answering with errors; the supervisor reports
    // them instead of the board refusing to boot.
    if (!g_actuator.init()) {
        log_error("BOARD", "pump output unavailable");
    }
    if (!g_sensors.init()) {
        log_error("BOARD", "analog inputs unavailable");
    }
    if (!g_network.init(cfg.network)) {
        log_error("BOARD", "WiFi unavailable");
    }
#else
    (void)cfg;
#endif
    return {&g_sensors, &g_actuator, &g_http, &g_network, &g_display};
}
