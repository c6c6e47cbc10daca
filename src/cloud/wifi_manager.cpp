#include "wifi_manager.h"
#include "core/console.h"
#include <Arduino.h>
#include <WiFi.h>

static volatile WiFiState state = WiFiState::OFF;

static const char* ssid = nullptr;
static const char* pass = nullptr;

static uint32_t lastAttempt = 0;
static uint32_t retryDelay = 5000;   // start with 5s
static const uint32_t MIN_DELAY = 5000;
static const uint32_t MAX_DELAY = 60000;

void WiFiManager::init(const char* networkSsid, const char* networkPass) {
    ssid = networkSsid;
    pass = networkPass;

    WiFi.mode(WIFI_STA);
    WiFi.disconnect(true);
    state = WiFiState::CONNECTING;

    // Make the first update() attempt immediately
    lastAttempt = millis() - retryDelay;
}

void WiFiManager::update() {
    uint32_t now = millis();

    switch (state) {

    case WiFiState::CONNECTING:
        if (WiFi.status() == WL_CONNECTED) {
            Console::printf("[WIFI] Connected, IP=%s\n", WiFi.localIP().toString().c_str());
            state = WiFiState::CONNECTED;
            retryDelay = MIN_DELAY; // reset backoff
            break;
        }

        if (now - lastAttempt >= retryDelay) {
            Console::printf("[WIFI] Connecting to %s...\n", ssid);
            WiFi.begin(ssid, pass);
            lastAttempt = now;
        }
        break;

    case WiFiState::CONNECTED:
        if (WiFi.status() != WL_CONNECTED) {
            Console::println("[WIFI] Lost connection");
            state = WiFiState::ERROR;
        }
        break;

    case WiFiState::ERROR:
        if (now - lastAttempt >= retryDelay) {
            retryDelay = min(retryDelay * 2, MAX_DELAY);
            Console::printf("[WIFI] Reconnecting, next backoff %lu ms\n",
                            static_cast<unsigned long>(retryDelay));
            WiFi.disconnect();
            state = WiFiState::CONNECTING;
            lastAttempt = now - retryDelay;
        }
        break;

    case WiFiState::OFF:
    default:
        break;
    }
}

bool WiFiManager::isConnected() {
    return state == WiFiState::CONNECTED && WiFi.status() == WL_CONNECTED;
}

WiFiState WiFiManager::getState() {
    return state;
}

const char* WiFiManager::toString(WiFiState s) {
    switch (s) {
        case WiFiState::OFF:        return "OFF";
        case WiFiState::CONNECTING: return "CONNECTING";
        case WiFiState::CONNECTED:  return "CONNECTED";
        case WiFiState::ERROR:      return "ERROR";
        default:                    return "UNKNOWN";
    }
}
