#include "auth.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

AuthenticationStrategy::AuthenticationStrategy(const ConnectionConfig& config)
    : config_(config) {
}

bool AuthenticationStrategy::looks_like_private_key(const std::string& key_material) {
    return key_material.find("-----BEGIN ") != std::string::npos &&
           key_material.find("PRIVATE KEY-----") != std::string::npos;
}

Result<void> AuthenticationStrategy::authenticate(SshSession& session) const {
    if (config_.password) {
        log_debug(fmt::format("Authenticating {} with password", config_.username));
        auto r = session.auth_password(config_.username, *config_.password);
        if (r.is_err()) return r;
        log_info(fmt::format("Authenticated {} (password)", config_.username));
        return Result<void>::Ok();
    }

    if (config_.private_key) {
        if (!looks_like_private_key(*config_.private_key)) {
            return Result<void>::Err(ErrorKind::SshKey, "Failed to parse private key");
        }
        log_debug(fmt::format("Authenticating {} with private key", config_.username));
        auto r = session.auth_publickey(config_.username, *config_.private_key);
        if (r.is_err()) return r;
        log_info(fmt::format("Authenticated {} (public key)", config_.username));
        return Result<void>::Ok();
    }

    return Result<void>::Err(ErrorKind::Authentication,
        "No authentication method available (require password or private_key)");
}
