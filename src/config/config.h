#pragma once

// ==================== FIRMWARE INFO ====================
#define FW_VERSION "1.0.0"

// ==================== PIN CONFIGURATION ====================
#ifndef RELAY_PIN
#define RELAY_PIN                  25
#endif

// Set to 0 if your relay board is active LOW
#ifndef RELAY_ACTIVE_HIGH
#define RELAY_ACTIVE_HIGH          1
#endif

// ==================== BACKEND ====================
#ifndef BACKEND_BASE_URL
#define BACKEND_BASE_URL           "https://smartaccesscontrol-backend-production.up.railway.app/api"
#endif

// PEM root certificate for the backend. Leave undefined to skip
// certificate validation on HTTPS.
// #define BACKEND_ROOT_CA         "-----BEGIN CERTIFICATE-----\n..."

#define REQUEST_TIMEOUT_MS         5000

// ==================== ACCESS TIMING ====================
#define UNLOCK_DURATION_MS         5000
#define DENY_FLASH_COUNT           6
#define DENY_FLASH_INTERVAL_MS     150

// ==================== SCAN INPUT ====================
#define SCAN_BAUD_RATE             115200
#define SCAN_MAX_UID_LENGTH        64

// ==================== WIFI ====================
#ifndef WIFI_SSID
#define WIFI_SSID                  "door-reader"
#endif
#ifndef WIFI_PASS
#define WIFI_PASS                  "change-me"
#endif

// ==================== TASKS ====================
#define ACCESS_TASK_STACK          8192
#define ACCESS_TASK_PRIORITY       2
#define LOG_TASK_STACK             8192
#define LOG_TASK_PRIORITY          1

// ==================== DEBUG ====================
#define DEBUG_SERIAL               1
