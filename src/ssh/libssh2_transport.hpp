#pragma once

#include "transport.hpp"

// Transport over libssh2 in non-blocking mode. Every libssh2 call on a
// session is made under that session's io mutex, held only for the call;
// waits happen outside the lock so concurrent channels interleave.
//
// The server host key is accepted without verification.
class Libssh2Transport : public Transport {
public:
    Libssh2Transport();

    Result<std::unique_ptr<SshSession>> open(const std::string& host, int port,
                                             std::chrono::milliseconds timeout) override;
};
