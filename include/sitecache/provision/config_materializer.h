#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sitecache/core/types.h>
#include <sitecache/provision/artifact_writer.h>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/mode_resolver.h>

namespace sitecache::provision {

// Resolved values written into a site's override artifact
struct InstanceParameters {
    Port port{0};
    MaxMemory maxMemory;
    std::string credential;
    std::string evictionPolicy{"allkeys-lru"};
};

/// Override artifact content; identical inputs give byte-identical output
std::string renderOverride(const InstancePaths& paths, const InstanceParameters& params);

/// The include line that links a base artifact to its override
std::string includeDirective(const std::filesystem::path& overrideConfig);

/// True when `content` already has the include line for `overrideConfig`
bool hasIncludeDirective(std::string_view content, const std::filesystem::path& overrideConfig);

/// Append the include line unless it is already present
std::string ensureIncludeDirective(std::string content,
                                   const std::filesystem::path& overrideConfig);

/**
 * Writes the base and override artifacts for one site. Fresh installs and
 * reinstalls start from the stock template; reconfigure only rewrites the
 * override.
 */
class ConfigMaterializer {
public:
    ConfigMaterializer(std::filesystem::path baseTemplate, std::optional<FileOwner> owner);

    /// Every file the run reads must be readable before anything is written:
    /// the stock template for fresh/reinstall, the site's base config for reconfigure
    Result<void> checkInputs(ModeKind mode, const InstancePaths& paths) const;

    Result<void> materialize(ModeKind mode, const InstancePaths& paths,
                             const InstanceParameters& params, ArtifactJournal& journal) const;

private:
    Result<void> writeBase(ModeKind mode, const InstancePaths& paths,
                           ArtifactJournal& journal) const;

    std::filesystem::path baseTemplate_;
    std::optional<FileOwner> owner_;
};

} // namespace sitecache::provision
