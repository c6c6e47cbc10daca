#include "http_authority_client.h"
#include "cloud/wifi_manager.h"
#include "config/config.h"

#include <Arduino.h>
#include <HTTPClient.h>
#include <WiFiClient.h>
#include <WiFiClientSecure.h>
#include <ArduinoJson.h>

#include <memory>

static const size_t BODY_DOC_CAPACITY = 256;

// ---------- REQUEST BODIES ----------

static std::string uidBody(const std::string& uid) {
    StaticJsonDocument<BODY_DOC_CAPACITY> doc;
    doc["rfid_uid"] = uid;

    std::string body;
    serializeJson(doc, body);
    return body;
}

static std::string grantedBody(const std::string& uid, const std::string& guestIdJson) {
    StaticJsonDocument<BODY_DOC_CAPACITY> doc;
    doc["rfid_uid"] = uid;
    if (guestIdJson.empty()) {
        doc["guest_id"] = nullptr;
    } else {
        // Forward the id exactly as the backend gave it to us
        doc["guest_id"] = serialized(guestIdJson);
    }

    std::string body;
    serializeJson(doc, body);
    return body;
}

static bool isHttps(const std::string& url) {
    return url.compare(0, 8, "https://") == 0;
}

// ================= PUBLIC =================

HttpAuthorityClient::HttpAuthorityClient(const ReaderConfig& cfg)
    : cfg(cfg) {}

HttpReply HttpAuthorityClient::verify(const std::string& uid) const {
    return post(cfg.verifyUrl(), uidBody(uid));
}

HttpReply HttpAuthorityClient::activate(const std::string& uid) const {
    return post(cfg.activateUrl(), uidBody(uid));
}

HttpReply HttpAuthorityClient::recordGranted(const std::string& uid, const std::string& guestIdJson) const {
    return post(cfg.grantedLogUrl(), grantedBody(uid, guestIdJson));
}

HttpReply HttpAuthorityClient::recordDenied(const std::string& uid) const {
    return post(cfg.deniedLogUrl(), uidBody(uid));
}

// ================= PRIVATE =================

HttpReply HttpAuthorityClient::post(const std::string& url, const std::string& body) const {
    HttpReply reply;

    if (!WiFiManager::isConnected()) {
        reply.code = HTTPC_ERROR_NOT_CONNECTED;
        reply.error = "WiFi not connected";
        return reply;
    }

    // Outlives http, which is declared after it
    std::unique_ptr<WiFiClient> client;
    if (isHttps(url)) {
        WiFiClientSecure* secure = new WiFiClientSecure();
#ifdef BACKEND_ROOT_CA
        secure->setCACert(BACKEND_ROOT_CA);
#else
        secure->setInsecure();
#endif
        client.reset(secure);
    } else {
        client.reset(new WiFiClient());
    }

    HTTPClient http;
    http.setConnectTimeout(cfg.request_timeout_ms);
    http.setTimeout(cfg.request_timeout_ms);

    bool begun = http.begin(*client, url.c_str());

    if (!begun) {
        reply.code = HTTPC_ERROR_CONNECTION_REFUSED;
        reply.error = "invalid URL " + url;
        return reply;
    }

    http.addHeader("Content-Type", "application/json");
    http.addHeader("Accept", "application/json");

    int code = http.POST(String(body.c_str()));
    reply.code = code;

    if (code > 0) {
        String payload = http.getString();
        reply.body.assign(payload.c_str(), payload.length());
    } else {
        reply.error = HTTPClient::errorToString(code).c_str();
    }

    http.end();
    return reply;
}
