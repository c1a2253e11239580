#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include <sitecache/core/types.h>

namespace sitecache::system {

/**
 * Authenticated liveness check against a running cache daemon.
 */
class ILivenessProber {
public:
    virtual ~ILivenessProber() = default;

    /// Success only when the daemon accepts the credential and answers PONG.
    /// AuthenticationFailed for a rejected credential, NetworkError/Timeout otherwise.
    virtual Result<void> probe(const std::string& host, Port port, const std::string& credential,
                               std::chrono::milliseconds timeout) = 0;
};

// RESP client over Boost.Asio: AUTH <credential> then PING
class RespLivenessProber : public ILivenessProber {
public:
    Result<void> probe(const std::string& host, Port port, const std::string& credential,
                       std::chrono::milliseconds timeout) override;

    /// RESP array-of-bulk-strings encoding of one command
    static std::string encodeCommand(const std::vector<std::string_view>& args);
};

} // namespace sitecache::system
