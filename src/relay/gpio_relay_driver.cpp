#include "gpio_relay_driver.h"
#include <Arduino.h>
#include <driver/gpio.h>
#include <algorithm>

GpioRelayDriver::GpioRelayDriver(bool activeHigh)
    : activeHigh(activeHigh) {}

bool GpioRelayDriver::setup(uint8_t pin, bool initialActive) {
    // Input-only pads (34-39 on ESP32) cannot drive a relay
    if (!GPIO_IS_VALID_OUTPUT_GPIO(static_cast<gpio_num_t>(pin))) {
        return false;
    }

    // Latch the level before switching to output so the relay never glitches
    digitalWrite(pin, levelFor(initialActive));
    pinMode(pin, OUTPUT);
    digitalWrite(pin, levelFor(initialActive));

    if (std::find(claimed.begin(), claimed.end(), pin) == claimed.end()) {
        claimed.push_back(pin);
    }
    return true;
}

void GpioRelayDriver::setOutput(uint8_t pin, bool active) {
    digitalWrite(pin, levelFor(active));
}

void GpioRelayDriver::cleanup() {
    for (size_t i = 0; i < claimed.size(); i++) {
        uint8_t pin = claimed[i];
        digitalWrite(pin, levelFor(false));
        // Hold the line at the inactive level once released
        pinMode(pin, activeHigh ? INPUT_PULLDOWN : INPUT_PULLUP);
    }
    claimed.clear();
}

uint8_t GpioRelayDriver::levelFor(bool active) const {
    return (active == activeHigh) ? HIGH : LOW;
}
