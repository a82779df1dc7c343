#pragma once

#include <string>
#include <core/types.hpp>
#include "transport.hpp"

// Logs a freshly opened session in with whatever credential is configured.
// Password is tried first when present, then key material. With neither,
// authentication fails before anything is sent.
//
// Usage:
//   AuthenticationStrategy auth(config);
//   auto r = auth.authenticate(*session);
//
class AuthenticationStrategy {
public:
    explicit AuthenticationStrategy(const ConnectionConfig& config);

    Result<void> authenticate(SshSession& session) const;

    // Quick structural check of key material before handing it to the transport.
    static bool looks_like_private_key(const std::string& key_material);

private:
    const ConnectionConfig& config_;
};
