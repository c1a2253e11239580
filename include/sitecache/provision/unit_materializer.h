#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sitecache/core/types.h>
#include <sitecache/provision/artifact_writer.h>
#include <sitecache/provision/instance.h>
#include <sitecache/provision/mode_resolver.h>

namespace sitecache::provision {

struct RenderedUnit {
    std::string content;
    std::vector<std::string> warnings; // optional fields missing from the template
};

/**
 * Rewrite the stock unit for one site: Description, ExecStart (stock config
 * path -> site base config), PIDFile and Alias. Missing ExecStart/PIDFile, or
 * an ExecStart that does not reference the stock config, is PreconditionFailed.
 */
Result<RenderedUnit> renderUnit(const std::string& stockTemplate, const InstancePaths& paths,
                                const std::filesystem::path& stockConfigPath);

class UnitMaterializer {
public:
    UnitMaterializer(std::filesystem::path unitTemplate, std::filesystem::path stockConfigPath,
                     std::optional<FileOwner> owner);

    /// Renders without writing: a missing or malformed stock unit fails here
    Result<void> checkInputs(ModeKind mode, const InstancePaths& paths) const;

    /// Reconfigure leaves an existing unit untouched; every other mode re-renders it
    Result<void> materialize(ModeKind mode, const InstancePaths& paths,
                             ArtifactJournal& journal) const;

private:
    bool keepsExistingUnit(ModeKind mode, const InstancePaths& paths) const;
    Result<RenderedUnit> render(const InstancePaths& paths) const;

    std::filesystem::path unitTemplate_;
    std::filesystem::path stockConfigPath_;
    std::optional<FileOwner> owner_;
};

} // namespace sitecache::provision
