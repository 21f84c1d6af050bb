#pragma once

#include "config.hpp"
#include "io_ports.hpp"

// Brings up the board and returns its ports. On ESP-IDF this configures the
// ADC, the climate probe and pump GPIOs, the WiFi station, SNTP and the HTTP
// client. Host builds get a small simulated field plot: the soil dries slowly
// and recovers while the pump runs. The ports live for the program lifetime.
DeviceIo init_board_io(const DeviceConfig& cfg);
