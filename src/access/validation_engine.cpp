#include "validation_engine.h"
#include "core/console.h"

#include <stdio.h>

static const int HTTP_OK        = 200;
static const int HTTP_FORBIDDEN = 403;
static const int HTTP_NOT_FOUND = 404;

// ================= PUBLIC =================

ValidationEngine::ValidationEngine(const ReaderConfig& cfg,
                                   const AuthorityClient& authority,
                                   RelayController& relay,
                                   AccessLogger& logger)
    : cfg(cfg), authority(authority), relay(relay), logger(logger) {}

void ValidationEngine::validate(const std::string& uid) {
    Console::printf("[ACCESS] Sending verification request for UID=%s\n", uid.c_str());

    HttpReply reply = authority.verify(uid);

    // The authority never answered: no verdict, so nothing to log
    if (reply.transportFailed()) {
        Console::printf("[ACCESS] Cannot connect to backend: %s\n", reply.error.c_str());
        return;
    }

    if (reply.code == HTTP_OK) {
        handleVerified(uid, reply);
    } else if (reply.code == HTTP_FORBIDDEN || reply.code == HTTP_NOT_FOUND) {
        handleRefused(uid, reply);
    } else {
        Console::printf("[ACCESS] Unexpected backend response: HTTP %d\n", reply.code);
        char reason[40];
        snprintf(reason, sizeof(reason), "Unexpected status %d", reply.code);
        denyAccess(uid, reason);
    }
}

// ================= PRIVATE =================

void ValidationEngine::handleVerified(const std::string& uid, const HttpReply& reply) {
    VerificationResult result;
    std::string error;

    if (!Verification::parseVerify(reply.body, result, error)) {
        Console::printf("[ACCESS] JSON parse error: %s\n", error.c_str());
        denyAccess(uid, "Backend JSON parse error.");
        return;
    }

#if DEBUG_SERIAL
    Console::printf("[ACCESS] Full backend response: %s\n", reply.body.c_str());
#endif

    if (!result.success) {
        denyAccess(uid, result.hasMessage ? result.message : "Unknown backend error.");
        return;
    }

    printDetails(uid, result);

    std::string settled;
    if (!activateIfAssigned(uid, result, settled)) {
        denyAccess(uid, "RFID " + uid + " could not be activated.");
        return;
    }

    grantAccess(uid, result, settled);
}

void ValidationEngine::handleRefused(const std::string& uid, const HttpReply& reply) {
    std::string reason;
    if (!Verification::parseDenialMessage(reply.body, reason)) {
        reason = "No detail provided";
    }
    denyAccess(uid, reason);
}

bool ValidationEngine::activateIfAssigned(const std::string& uid,
                                          const VerificationResult& result,
                                          std::string& settled) {
    if (!result.hasStatus) {
        Console::printf("[ACCESS] No RFID status for %s in backend reply\n", uid.c_str());
        return false;
    }

    if (result.status != CredentialStatus::ASSIGNED) {
        settled = result.statusText;
        return true;
    }

    Console::println("[ACCESS] RFID status is 'assigned'. Attempting to activate...");

    HttpReply reply = authority.activate(uid);

    if (reply.transportFailed()) {
        Console::printf("[ACCESS] Cannot connect to backend to activate RFID: %s\n",
                        reply.error.c_str());
        return false;
    }

    if (reply.code != HTTP_OK) {
        Console::printf("[ACCESS] Unexpected HTTP %d activating RFID.\n", reply.code);
        return false;
    }

    ActivationResult activation;
    std::string error;
    if (!Verification::parseActivation(reply.body, activation, error)) {
        Console::printf("[ACCESS] Activation reply parse error: %s\n", error.c_str());
        return false;
    }

    if (!activation.success) {
        Console::printf("[ACCESS] Could not activate RFID %s: %s\n", uid.c_str(),
                        activation.hasMessage ? activation.message.c_str() : "no message");
        return false;
    }

    if (activation.statusNull) {
        Console::printf("[ACCESS] Activation of RFID %s returned a null status.\n", uid.c_str());
        return false;
    }

    settled = activation.statusText;
    Console::printf("[ACCESS] RFID %s successfully activated (status=%s).\n",
                    uid.c_str(), settled.c_str());
    return true;
}

void ValidationEngine::grantAccess(const std::string& uid,
                                   const VerificationResult& result,
                                   const std::string& status) {
    Console::printf("[ACCESS] GRANTED uid=%s status=%s\n", uid.c_str(), status.c_str());

    relay.engage(cfg.unlock_duration_ms);

    logger.record(AccessOutcome::granted(uid, result.guest.idJson));
}

void ValidationEngine::denyAccess(const std::string& uid, const std::string& reason) {
    Console::printf("[ACCESS] DENIED uid=%s reason=%s\n", uid.c_str(), reason.c_str());

    relay.signalDenial(cfg.deny_flash_count, cfg.deny_flash_interval_ms);

    logger.record(AccessOutcome::denied(uid));
}

void ValidationEngine::printDetails(const std::string& uid, const VerificationResult& result) const {
    Console::printf("[ACCESS] RFID Verified: %s\n", uid.c_str());

    if (result.guest.present) {
        Console::printf("[ACCESS] Guest Info => ID=%s, Name=%s\n",
                        result.guest.idJson.empty() ? "null" : result.guest.idJson.c_str(),
                        result.guest.name.c_str());
    } else {
        Console::println("[ACCESS] WARNING: No guest info provided by backend.");
    }

    if (result.room.present) {
        Console::printf("[ACCESS] Room Info => ID=%s, Number=%s, Status=%s, check_in=%s, check_out=%s\n",
                        result.room.id.c_str(), result.room.number.c_str(),
                        result.room.status.c_str(), result.room.checkIn.c_str(),
                        result.room.checkOut.c_str());
    } else {
        Console::println("[ACCESS] WARNING: No room info provided by backend.");
    }
}
