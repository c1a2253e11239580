#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sitecache/config/host_config.h>
#include <sitecache/provision/instance.h>

namespace sitecache::provision {

/**
 * Owns the per-site naming convention. Built once from the host config and
 * shared by every component; no other code composes instance paths.
 */
class InstanceLayout {
public:
    explicit InstanceLayout(const config::HostConfig& cfg);

    InstancePaths pathsFor(const std::string& site) const;

    /// "overrides.<site>.conf" -> site; nullopt for anything else
    std::optional<std::string> siteFromOverrideFile(const std::filesystem::path& file) const;

    /// Name of the systemd unit for a site
    std::string unitNameFor(std::string_view site) const;

    const std::filesystem::path& overrideDir() const { return overrideDir_; }
    const std::filesystem::path& sitesRoot() const { return sitesRoot_; }
    const std::filesystem::path& baseTemplate() const { return baseTemplate_; }
    const std::filesystem::path& unitTemplate() const { return unitTemplate_; }

private:
    std::filesystem::path sitesRoot_;
    std::filesystem::path configRoot_;
    std::filesystem::path overrideDir_;
    std::filesystem::path unitRoot_;
    std::filesystem::path logDir_;
    std::filesystem::path runDir_;
    std::filesystem::path baseTemplate_;
    std::filesystem::path unitTemplate_;
    std::string configPrefix_;
    std::string servicePrefix_;
    std::string aliasPrefix_;
};

} // namespace sitecache::provision
