#pragma once
#include <stdint.h>

enum class WiFiState : uint8_t {
    OFF,
    CONNECTING,
    CONNECTED,
    ERROR
};

class WiFiManager {
public:
    static void init(const char* ssid, const char* pass);
    static void update();           // called repeatedly from loop() on Core 0
    static bool isConnected();
    static WiFiState getState();
    static const char* toString(WiFiState s);
};
