#pragma once
#include <stdint.h>
#include <vector>
#include "relay/relay_driver.h"

// Arduino GPIO binding for the relay board.
class GpioRelayDriver : public RelayDriver {
public:
    explicit GpioRelayDriver(bool activeHigh = true);

    bool setup(uint8_t pin, bool initialActive) override;
    void setOutput(uint8_t pin, bool active) override;
    void cleanup() override;

private:
    uint8_t levelFor(bool active) const;

    bool activeHigh;
    std::vector<uint8_t> claimed;
};
