#include "async_access_logger.h"
#include "core/console.h"

#include <memory>
#include <new>
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

// Owned by the log task from xTaskCreate() on
struct LogJob {
    const AuthorityClient& client;
    AccessOutcome outcome;
};

AsyncAccessLogger::AsyncAccessLogger(const AuthorityClient& client, uint32_t stackBytes, uint8_t priority)
    : client(client), stackBytes(stackBytes), priority(priority) {}

void AsyncAccessLogger::record(const AccessOutcome& outcome) {
    std::unique_ptr<LogJob> job(new (std::nothrow) LogJob{client, outcome});
    if (!job) {
        Console::printf("[LOG] ERROR: out of memory, %s log for %s dropped\n",
                        toString(outcome.kind()), outcome.uid().c_str());
        return;
    }

    BaseType_t created = xTaskCreate(
        logTask,
        "access_log",
        stackBytes,
        job.get(),
        priority,
        nullptr
    );

    if (created != pdPASS) {
        Console::printf("[LOG] ERROR: could not start log task, %s log for %s dropped\n",
                        toString(outcome.kind()), outcome.uid().c_str());
        return;
    }

    job.release();
}

void AsyncAccessLogger::logTask(void* param) {
    {
        std::unique_ptr<LogJob> job(static_cast<LogJob*>(param));
        deliverAccessLog(job->client, job->outcome);
    }
    vTaskDelete(nullptr);
}
