#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <sitecache/core/types.h>

namespace sitecache::config {

/**
 * Host-wide settings for provisioning. Defaults match a stock Debian/Ubuntu
 * redis-server package layout.
 */
struct HostConfig {
    // [paths]
    std::filesystem::path sitesRoot{"/sites"};
    std::filesystem::path configRoot{"/etc/redis"};
    std::filesystem::path siteConfigDir{"sites"}; // relative to configRoot unless absolute
    std::filesystem::path baseTemplate{"/etc/redis/redis.conf"};
    std::filesystem::path unitTemplate{"/lib/systemd/system/redis-server.service"};
    std::filesystem::path unitRoot{"/etc/systemd/system"};
    std::filesystem::path logDir{"/var/log/redis"};
    std::filesystem::path runDir{"/run/redis"};
    std::filesystem::path lockFile{"/run/lock/sitecache.lock"};

    // [naming]
    std::string configPrefix{"redis"};
    std::string servicePrefix{"redis-server"};
    std::string aliasPrefix{"redis"};

    // [daemon]
    std::string daemonUser{"redis"};
    std::string daemonGroup{"redis"};
    bool manageOwnership{true};
    std::string evictionPolicy{"allkeys-lru"};
    std::string defaultMaxMemory{"256M"};

    // [ports]
    Port portRangeStart{6380};
    Port portRangeEnd{6400};

    // [lifecycle]
    std::chrono::milliseconds settleDelay{2000};
    int probeAttempts{3};
    std::chrono::milliseconds probeInterval{500};
    std::chrono::milliseconds probeTimeout{2000};
    std::string probeHost{"127.0.0.1"};

    // [host]
    bool requireRoot{true};

    // [integration]
    bool integrationEnabled{true};
    std::string portConstant{"WP_REDIS_PORT"};
    std::string passwordConstant{"WP_REDIS_PASSWORD"};
    std::string pluginSlug{"spinupwp"};

    std::filesystem::path overrideDir() const {
        return siteConfigDir.is_absolute() ? siteConfigDir : configRoot / siteConfigDir;
    }

    /// Apply flattened "section.key" values on top of the current settings
    Result<void> applyValues(const std::map<std::string, std::string>& values);

    /// Check cross-field constraints (port range bounds, probe counts)
    Result<void> validate() const;

    /// Load from a simple TOML file; a missing file yields defaults
    static Result<HostConfig> load(const std::filesystem::path& path);
};

} // namespace sitecache::config
