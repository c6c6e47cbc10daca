#include <Arduino.h>
#include <WiFi.h>

// ===== CORE =====
#include "core/console.h"
#include "core/serial_console.h"
#include "config/config.h"
#include "config/reader_config.h"

// ===== ACCESS =====
#include "access/scan_reader.h"
#include "access/validation_engine.h"

// ===== HARDWARE =====
#include "relay/gpio_relay_driver.h"
#include "relay/relay_controller.h"

// ===== CLOUD =====
#include "cloud/async_access_logger.h"
#include "cloud/http_authority_client.h"
#include "cloud/wifi_manager.h"

static void pauseMs(uint32_t ms) {
    delay(ms);
}

// Log tasks outlive any single scan, so everything they touch is static
static const ReaderConfig readerConfig = ReaderConfig();
static HttpAuthorityClient authority(readerConfig);
static AsyncAccessLogger accessLogger(authority, LOG_TASK_STACK, LOG_TASK_PRIORITY);

// Claimed in setup() before anything else, released by the access task
static GpioRelayDriver relayDriver(readerConfig.relay_active_high);
static RelayController relay(relayDriver, pauseMs);

// =====================================================
// ACCESS LOOP
// =====================================================
// Returns on Ctrl+C or when the relay cannot be claimed. The guard
// puts the relay back to locked on either path.
static void runAccessLoop() {
    RelayGuard guard(relay, readerConfig.relay_pin);
    if (!guard.isAcquired()) {
        Console::printf("[MAIN] ERROR: relay pin %u unavailable, access loop not started\n",
                        readerConfig.relay_pin);
        return;
    }

    ValidationEngine engine(readerConfig, authority, relay, accessLogger);
    ScanReader reader(readerConfig.max_uid_length);

    Console::println("[MAIN] RFID Reader is active. Waiting for scans (Ctrl+C to exit).");

    while (true) {
        if (!Serial.available()) {
            vTaskDelay(5 / portTICK_PERIOD_MS);
            continue;
        }

        int c = Serial.read();
        if (c < 0) continue;

        switch (reader.feed(static_cast<char>(c))) {
            case ScanEvent::LINE:
                engine.validate(reader.line());
                break;

            case ScanEvent::INTERRUPT:
                Console::println("[MAIN] Exiting RFID reader gracefully...");
                return;

            case ScanEvent::NONE:
            default:
                break;
        }
    }
}

// =====================================================
// CORE 1 TASK
// =====================================================
void core1_access_task(void* param) {
    Console::println("[CORE1] Access task starting");

    runAccessLoop();

    Console::println("[CORE1] Access task stopped, relay released");
    vTaskDelete(nullptr);
}

// =====================================================
// SETUP
// =====================================================
void setup() {
    // FAIL-SAFE: lock door immediately on boot
    bool relayLocked = relay.init(readerConfig.relay_pin);

    SerialConsole::init(SCAN_BAUD_RATE);
    delay(500);

    Console::printf("\n[BOOT] rfidgate %s starting\n", FW_VERSION);
    if (!relayLocked) {
        Console::printf("[BOOT] ERROR: relay pin %u could not be locked\n", readerConfig.relay_pin);
    }
    Console::printf("[BOOT] Backend: %s\n", readerConfig.backend_base_url.c_str());

    WiFiManager::init(WIFI_SSID, WIFI_PASS);
    Console::printf("[BOOT] ESP32 MAC: %s\n", WiFi.macAddress().c_str());

    // --- START CORE 1 TASK ---
    BaseType_t created = xTaskCreatePinnedToCore(
        core1_access_task,
        "core1_access",
        ACCESS_TASK_STACK,
        nullptr,
        ACCESS_TASK_PRIORITY,
        nullptr,
        1   // CORE 1
    );

    if (created != pdPASS) {
        Console::println("[MAIN] ERROR: could not create access task");
        return;
    }

    Console::println("[MAIN] Core 1 access task created");
}

void loop() {
    static WiFiState lastState = WiFiState::OFF;

    WiFiManager::update();

    WiFiState current = WiFiManager::getState();
    if (current != lastState) {
        Console::printf("[WIFI] State %s -> %s\n",
                        WiFiManager::toString(lastState), WiFiManager::toString(current));
        lastState = current;
    }

    vTaskDelay(100 / portTICK_PERIOD_MS);
}
