#pragma once

#include "access/access_outcome.h"
#include "cloud/authority_client.h"

// Records access outcomes with the authority. record() must return
// without waiting on the network.
class AccessLogger {
public:
    virtual ~AccessLogger() {}
    virtual void record(const AccessOutcome& outcome) = 0;
};

// Blocking write of one outcome to its access-log endpoint. Returns true
// only on HTTP 201; every other result is reported on the console.
bool deliverAccessLog(const AuthorityClient& client, const AccessOutcome& outcome);
