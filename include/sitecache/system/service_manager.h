#pragma once

#include <chrono>
#include <string>
#include <sitecache/core/types.h>

namespace sitecache::system {

/**
 * Host service manager operations used by provisioning, addressed by unit
 * name (e.g. "redis-server-example.com.service").
 */
class IServiceManager {
public:
    virtual ~IServiceManager() = default;

    virtual Result<void> reloadConfiguration() = 0;
    virtual Result<void> enable(const std::string& unit) = 0;
    virtual Result<void> start(const std::string& unit) = 0;
    virtual Result<void> stop(const std::string& unit) = 0;
    virtual Result<void> restart(const std::string& unit) = 0;

    /// true when the unit is active; errors only when the query itself could not run
    virtual Result<bool> isActive(const std::string& unit) = 0;
};

// systemctl-backed implementation
class SystemctlServiceManager : public IServiceManager {
public:
    explicit SystemctlServiceManager(std::string systemctl = "systemctl",
                                     std::chrono::milliseconds timeout = std::chrono::seconds(90));

    Result<void> reloadConfiguration() override;
    Result<void> enable(const std::string& unit) override;
    Result<void> start(const std::string& unit) override;
    Result<void> stop(const std::string& unit) override;
    Result<void> restart(const std::string& unit) override;
    Result<bool> isActive(const std::string& unit) override;

private:
    Result<void> run(const std::string& verb, const std::string& unit);

    std::string systemctl_;
    std::chrono::milliseconds timeout_;
};

} // namespace sitecache::system
