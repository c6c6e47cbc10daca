#include "verification.h"

#include <ArduinoJson.h>

// Room for guest + room details with generous string fields
static const size_t VERIFY_DOC_CAPACITY = 2048;
static const size_t SMALL_DOC_CAPACITY  = 512;

// ================= HELPERS =================

// Strings come back as-is, anything else (ids, room numbers) as JSON text
static std::string textOf(JsonVariantConst v) {
    if (v.isNull()) return std::string();

    const char* s = v.as<const char*>();
    if (s) return std::string(s);

    std::string out;
    serializeJson(v, out);
    return out;
}

static JsonObjectConst parseObject(const std::string& body, DynamicJsonDocument& doc, std::string& error) {
    DeserializationError err = deserializeJson(doc, body);
    if (err) {
        error = err.c_str();
        return JsonObjectConst();
    }

    const DynamicJsonDocument& readOnly = doc;
    JsonObjectConst root = readOnly.as<JsonObjectConst>();
    if (root.isNull()) {
        error = "root is not an object";
    }
    return root;
}

// ================= PARSERS =================

bool Verification::parseVerify(const std::string& body, VerificationResult& out, std::string& error) {
    DynamicJsonDocument doc(VERIFY_DOC_CAPACITY);
    JsonObjectConst root = parseObject(body, doc, error);
    if (root.isNull()) return false;

    out = VerificationResult();
    out.success = root["success"] | false;

    const char* message = root["message"].as<const char*>();
    if (message) {
        out.hasMessage = true;
        out.message = message;
    }

    JsonObjectConst data = root["data"].as<JsonObjectConst>();

    JsonVariantConst status = data["rfid"]["status"];
    if (!status.isNull()) {
        out.hasStatus = true;
        out.statusText = textOf(status);
        out.status = statusFromText(out.statusText);
    }

    JsonObjectConst guest = data["guest"].as<JsonObjectConst>();
    if (!guest.isNull() && guest.size() > 0) {
        out.guest.present = true;
        JsonVariantConst id = guest["id"];
        if (!id.isNull()) {
            serializeJson(id, out.guest.idJson);
        }
        out.guest.name = textOf(guest["name"]);
    }

    JsonObjectConst room = data["room"].as<JsonObjectConst>();
    if (!room.isNull() && room.size() > 0) {
        out.room.present  = true;
        out.room.id       = textOf(room["id"]);
        out.room.number   = textOf(room["room_number"]);
        out.room.status   = textOf(room["status"]);
        out.room.checkIn  = textOf(room["check_in"]);
        out.room.checkOut = textOf(room["check_out"]);
    }

    return true;
}

bool Verification::parseActivation(const std::string& body, ActivationResult& out, std::string& error) {
    DynamicJsonDocument doc(SMALL_DOC_CAPACITY);
    JsonObjectConst root = parseObject(body, doc, error);
    if (root.isNull()) return false;

    out = ActivationResult();
    out.success = root["success"] | false;

    const char* message = root["message"].as<const char*>();
    if (message) {
        out.hasMessage = true;
        out.message = message;
    }

    // Absent key settles as "unknown", an explicit null is kept apart
    JsonObjectConst data = root["data"].as<JsonObjectConst>();
    if (!data.isNull() && data.containsKey("status")) {
        JsonVariantConst status = data["status"];
        if (status.isNull()) {
            out.statusNull = true;
        } else {
            out.statusText = textOf(status);
        }
    }

    return true;
}

bool Verification::parseDenialMessage(const std::string& body, std::string& message) {
    DynamicJsonDocument doc(SMALL_DOC_CAPACITY);
    std::string error;
    JsonObjectConst root = parseObject(body, doc, error);
    if (root.isNull()) return false;

    const char* m = root["message"].as<const char*>();
    if (!m) return false;

    message = m;
    return true;
}

// ================= STRING HELPERS =================

CredentialStatus Verification::statusFromText(const std::string& text) {
    if (text == "unassigned") return CredentialStatus::UNASSIGNED;
    if (text == "assigned")   return CredentialStatus::ASSIGNED;
    if (text == "active")     return CredentialStatus::ACTIVE;
    return CredentialStatus::UNKNOWN;
}

const char* Verification::toString(CredentialStatus status) {
    switch (status) {
        case CredentialStatus::UNASSIGNED: return "unassigned";
        case CredentialStatus::ASSIGNED:   return "assigned";
        case CredentialStatus::ACTIVE:     return "active";
        default:                           return "unknown";
    }
}
