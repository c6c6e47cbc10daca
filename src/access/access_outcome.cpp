#include "access_outcome.h"

AccessOutcome AccessOutcome::granted(const std::string& uid, const std::string& guestIdJson) {
    return AccessOutcome(AccessKind::GRANTED, uid, guestIdJson);
}

AccessOutcome AccessOutcome::denied(const std::string& uid) {
    return AccessOutcome(AccessKind::DENIED, uid, std::string());
}

const char* toString(AccessKind kind) {
    switch (kind) {
        case AccessKind::GRANTED: return "GRANTED";
        case AccessKind::DENIED:  return "DENIED";
        default:                  return "UNKNOWN";
    }
}
