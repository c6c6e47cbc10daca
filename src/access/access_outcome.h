#pragma once

#include <stdint.h>
#include <string>

enum class AccessKind : uint8_t {
    GRANTED,
    DENIED
};

// The fact handed to the access logger once a verdict has been acted on.
class AccessOutcome {
public:
    // guestIdJson is the guest id exactly as the authority sent it
    // (a JSON number or string); empty means no guest is known.
    static AccessOutcome granted(const std::string& uid, const std::string& guestIdJson);
    static AccessOutcome denied(const std::string& uid);

    AccessKind kind() const { return kind_; }
    const std::string& uid() const { return uid_; }
    bool hasGuestId() const { return !guestIdJson_.empty(); }
    const std::string& guestIdJson() const { return guestIdJson_; }

private:
    AccessOutcome(AccessKind kind, const std::string& uid, const std::string& guestIdJson)
        : kind_(kind), uid_(uid), guestIdJson_(guestIdJson) {}

    AccessKind kind_;
    std::string uid_;
    std::string guestIdJson_;
};

const char* toString(AccessKind kind);
