#pragma once

#include <string>

#include "access/verification.h"
#include "cloud/access_logger.h"
#include "cloud/authority_client.h"
#include "config/reader_config.h"
#include "relay/relay_controller.h"

// ================= VALIDATION ENGINE =================
// Turns one scanned UID into a verdict: verify with the authority,
// activate the card on first use, then unlock or flash, then hand the
// outcome to the logger. Runs on the access task, one scan at a time.

class ValidationEngine {
public:
    ValidationEngine(const ReaderConfig& cfg,
                     const AuthorityClient& authority,
                     RelayController& relay,
                     AccessLogger& logger);

    void validate(const std::string& uid);

private:
    void handleVerified(const std::string& uid, const HttpReply& reply);
    void handleRefused(const std::string& uid, const HttpReply& reply);

    // Settled status in `settled`; false if the card may not be used
    bool activateIfAssigned(const std::string& uid,
                            const VerificationResult& result,
                            std::string& settled);

    void grantAccess(const std::string& uid,
                     const VerificationResult& result,
                     const std::string& status);
    void denyAccess(const std::string& uid, const std::string& reason);

    void printDetails(const std::string& uid, const VerificationResult& result) const;

    const ReaderConfig& cfg;
    const AuthorityClient& authority;
    RelayController& relay;
    AccessLogger& logger;
};
