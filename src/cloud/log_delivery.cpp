#include "access_logger.h"
#include "core/console.h"

static const int HTTP_CREATED = 201;

bool deliverAccessLog(const AuthorityClient& client, const AccessOutcome& outcome) {
    HttpReply reply;

    switch (outcome.kind()) {
        case AccessKind::GRANTED:
            reply = client.recordGranted(outcome.uid(), outcome.guestIdJson());
            break;
        case AccessKind::DENIED:
        default:
            reply = client.recordDenied(outcome.uid());
            break;
    }

    if (reply.transportFailed()) {
        Console::printf("[LOG] Logging request failed for %s: %s\n",
                        outcome.uid().c_str(), reply.error.c_str());
        return false;
    }

    if (reply.code != HTTP_CREATED) {
        Console::printf("[LOG] Logging failed: HTTP %d\n", reply.code);
        return false;
    }

    if (outcome.kind() == AccessKind::GRANTED) {
        Console::println("[LOG] Access granted logged successfully.");
    } else {
        Console::println("[LOG] Access denied logged successfully.");
    }
    return true;
}
