#pragma once

#include <stdint.h>
#include "cloud/access_logger.h"

// Fire-and-forget logger: every record() spawns its own FreeRTOS task
// that posts the outcome and deletes itself. Nothing waits for it.
class AsyncAccessLogger : public AccessLogger {
public:
    AsyncAccessLogger(const AuthorityClient& client, uint32_t stackBytes, uint8_t priority);

    void record(const AccessOutcome& outcome) override;

private:
    static void logTask(void* param);

    const AuthorityClient& client;
    uint32_t stackBytes;
    uint8_t priority;
};
