#pragma once
#include <stdint.h>
#include "relay/relay_driver.h"

class RelayController {
public:
    typedef void (*DelayFn)(uint32_t ms);

    RelayController(RelayDriver& driver, DelayFn pause);

    bool init(uint8_t pin);
    void release();
    bool isInitialized() const { return initialized; }

    // Unlock for durationMs, then lock again. Blocks the caller.
    void engage(uint32_t durationMs);

    // Blink the relay to show a rejected card. Never leaves it unlocked.
    void signalDenial(uint8_t flashCount = 6, uint32_t intervalMs = 150);

    void lock();

private:
    void setRelay(bool unlock);

    RelayDriver& driver;
    DelayFn pause;
    uint8_t pin;
    bool initialized;
};

// Scoped claim on the relay pin. Whatever path leaves the scope, the
// relay ends locked and the pin is handed back. A relay already claimed
// at boot is adopted as is.
class RelayGuard {
public:
    RelayGuard(RelayController& relay, uint8_t pin)
        : relay(relay), acquired(relay.isInitialized() || relay.init(pin)) {}
    ~RelayGuard() { relay.release(); }

    bool isAcquired() const { return acquired; }

private:
    RelayGuard(const RelayGuard&);
    RelayGuard& operator=(const RelayGuard&);

    RelayController& relay;
    bool acquired;
};
