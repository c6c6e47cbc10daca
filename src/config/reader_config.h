#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "config/config.h"

// Runtime view of config.h. Built once at boot and handed by reference
// to every component; never mutated afterwards.
struct ReaderConfig {
  std::string backend_base_url = BACKEND_BASE_URL;
  uint32_t request_timeout_ms = REQUEST_TIMEOUT_MS;

  uint8_t relay_pin = RELAY_PIN;
  bool relay_active_high = (RELAY_ACTIVE_HIGH != 0);
  uint32_t unlock_duration_ms = UNLOCK_DURATION_MS;
  uint8_t deny_flash_count = DENY_FLASH_COUNT;
  uint32_t deny_flash_interval_ms = DENY_FLASH_INTERVAL_MS;

  size_t max_uid_length = SCAN_MAX_UID_LENGTH;

  std::string verifyUrl() const { return backend_base_url + "/rfid/verify"; }
  std::string activateUrl() const { return backend_base_url + "/rfid/activate"; }
  std::string grantedLogUrl() const { return backend_base_url + "/access-logs/granted"; }
  std::string deniedLogUrl() const { return backend_base_url + "/access-logs/denied"; }
};
