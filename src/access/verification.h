#pragma once

#include <stdint.h>
#include <string>

enum class CredentialStatus : uint8_t {
    UNASSIGNED,
    ASSIGNED,
    ACTIVE,
    UNKNOWN
};

struct GuestInfo {
    bool present = false;
    std::string idJson;      // raw JSON of "id", empty if absent
    std::string name;
};

struct RoomInfo {
    bool present = false;
    std::string id;
    std::string number;
    std::string status;
    std::string checkIn;
    std::string checkOut;
};

// Body of a 200 reply from /rfid/verify
struct VerificationResult {
    bool success = false;
    bool hasMessage = false;
    std::string message;

    bool hasStatus = false;
    std::string statusText;
    CredentialStatus status = CredentialStatus::UNKNOWN;

    GuestInfo guest;
    RoomInfo room;
};

// Body of a 200 reply from /rfid/activate
struct ActivationResult {
    bool success = false;
    bool hasMessage = false;
    std::string message;
    std::string statusText = "unknown";
    bool statusNull = false;     // "data.status" sent as null
};

namespace Verification {
    // Each parser returns false when the body is not a JSON object.
    // error receives the ArduinoJson diagnostic in that case.
    bool parseVerify(const std::string& body, VerificationResult& out, std::string& error);
    bool parseActivation(const std::string& body, ActivationResult& out, std::string& error);

    // "message" of a 403/404 body, false if unparseable or missing
    bool parseDenialMessage(const std::string& body, std::string& message);

    CredentialStatus statusFromText(const std::string& text);
    const char* toString(CredentialStatus status);
}
