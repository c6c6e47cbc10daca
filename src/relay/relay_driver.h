#pragma once
#include <stdint.h>

// Pin-level access to the relay output. The GPIO binding implements it
// on the board; tests substitute a recording fake.
class RelayDriver {
public:
    virtual ~RelayDriver() {}

    // Claim the pin as an output already driven to the given level
    virtual bool setup(uint8_t pin, bool initialActive) = 0;
    virtual void setOutput(uint8_t pin, bool active) = 0;

    // Release every pin claimed through setup()
    virtual void cleanup() = 0;
};
