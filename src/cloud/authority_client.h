#pragma once

#include <string>

// Result of one request to the authority. code > 0 is the HTTP status;
// code <= 0 means the request never got a reply (no WiFi, DNS, connect
// refused, timeout) and error says why.
struct HttpReply {
    int code = 0;
    std::string body;
    std::string error;

    bool transportFailed() const { return code <= 0; }
};

// Remote authority endpoints. One exchange per call, no retry.
class AuthorityClient {
public:
    virtual ~AuthorityClient() {}

    virtual HttpReply verify(const std::string& uid) const = 0;
    virtual HttpReply activate(const std::string& uid) const = 0;

    // guestIdJson: raw JSON id from the verify reply, empty for null
    virtual HttpReply recordGranted(const std::string& uid, const std::string& guestIdJson) const = 0;
    virtual HttpReply recordDenied(const std::string& uid) const = 0;
};
