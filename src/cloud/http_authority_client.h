#pragma once

#include "cloud/authority_client.h"
#include "config/reader_config.h"

// HTTPClient binding. Holds only the configuration; each call opens its
// own HTTPClient, so the access task and log tasks can share one instance.
class HttpAuthorityClient : public AuthorityClient {
public:
    explicit HttpAuthorityClient(const ReaderConfig& cfg);

    HttpReply verify(const std::string& uid) const override;
    HttpReply activate(const std::string& uid) const override;
    HttpReply recordGranted(const std::string& uid, const std::string& guestIdJson) const override;
    HttpReply recordDenied(const std::string& uid) const override;

private:
    HttpReply post(const std::string& url, const std::string& body) const;

    const ReaderConfig& cfg;
};
