#include <sitecache/provision/config_materializer.h>

#include <spdlog/spdlog.h>
#include <sstream>

namespace sitecache::provision {

namespace fs = std::filesystem;

namespace {
constexpr auto kOverridePerms = fs::perms::owner_read | fs::perms::owner_write |
                                fs::perms::group_read;
constexpr auto kBasePerms = fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read;

std::string_view trimLine(std::string_view line) {
    while (!line.empty() && (line.front() == ' ' || line.front() == '\t'))
        line.remove_prefix(1);
    while (!line.empty() &&
           (line.back() == ' ' || line.back() == '\t' || line.back() == '\r'))
        line.remove_suffix(1);
    return line;
}
} // namespace

std::string renderOverride(const InstancePaths& paths, const InstanceParameters& params) {
    std::ostringstream out;
    out << "port " << params.port << '\n';
    out << "pidfile " << paths.pidFile.string() << '\n';
    out << "logfile " << paths.logFile.string() << '\n';
    out << "dbfilename " << paths.dataFileName << '\n';
    out << "maxmemory " << params.maxMemory.toString() << '\n';
    out << "maxmemory-policy " << params.evictionPolicy << '\n';
    out << "requirepass \"" << params.credential << "\"\n";
    return out.str();
}

std::string includeDirective(const fs::path& overrideConfig) {
    return "include " + overrideConfig.string();
}

bool hasIncludeDirective(std::string_view content, const fs::path& overrideConfig) {
    const std::string wanted = includeDirective(overrideConfig);
    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto end = content.find('\n', pos);
        auto line = content.substr(pos, end == std::string_view::npos ? end : end - pos);
        if (trimLine(line) == wanted)
            return true;
        if (end == std::string_view::npos)
            break;
        pos = end + 1;
    }
    return false;
}

std::string ensureIncludeDirective(std::string content, const fs::path& overrideConfig) {
    if (hasIncludeDirective(content, overrideConfig))
        return content;
    if (!content.empty() && content.back() != '\n')
        content.push_back('\n');
    content += includeDirective(overrideConfig);
    content.push_back('\n');
    return content;
}

ConfigMaterializer::ConfigMaterializer(fs::path baseTemplate, std::optional<FileOwner> owner)
    : baseTemplate_(std::move(baseTemplate)), owner_(owner) {}

Result<void> ConfigMaterializer::checkInputs(ModeKind mode, const InstancePaths& paths) const {
    if (mode == ModeKind::Cancel) {
        return Error{ErrorCode::InvalidState, "Nothing to materialize for a cancelled run"};
    }
    if (mode == ModeKind::Reconfigure) {
        if (!readFile(paths.baseConfig)) {
            return Error{ErrorCode::PreconditionFailed,
                         "Base config " + paths.baseConfig.string() +
                             " is missing; reinstall the instance instead"};
        }
        return {};
    }
    if (!readFile(baseTemplate_)) {
        return Error{ErrorCode::PreconditionFailed,
                     "Cannot read stock base config " + baseTemplate_.string()};
    }
    return {};
}

Result<void> ConfigMaterializer::writeBase(ModeKind mode, const InstancePaths& paths,
                                           ArtifactJournal& journal) const {
    const bool fromTemplate = mode == ModeKind::FreshInstall || mode == ModeKind::Reinstall;
    const auto& source = fromTemplate ? baseTemplate_ : paths.baseConfig;

    auto content = readFile(source);
    if (!content) {
        if (!fromTemplate) {
            return Error{ErrorCode::PreconditionFailed,
                         "Base config " + paths.baseConfig.string() +
                             " is missing; reinstall the instance instead"};
        }
        return content.error();
    }

    if (!fromTemplate && hasIncludeDirective(content.value(), paths.overrideConfig)) {
        spdlog::debug("Include directive already present in {}", paths.baseConfig.string());
        journal.markUntouched(ArtifactKind::BaseConfig);
        return {};
    }

    auto updated = ensureIncludeDirective(std::move(content).value(), paths.overrideConfig);
    auto w = writeFileAtomic(paths.baseConfig, updated, kBasePerms, owner_);
    if (!w)
        return w;
    journal.markWritten(ArtifactKind::BaseConfig);
    spdlog::info("Wrote base config {}", paths.baseConfig.string());
    return {};
}

Result<void> ConfigMaterializer::materialize(ModeKind mode, const InstancePaths& paths,
                                             const InstanceParameters& params,
                                             ArtifactJournal& journal) const {
    if (auto r = checkInputs(mode, paths); !r)
        return r;

    // Override first: the base artifact's include must never point at a missing file
    auto w = writeFileAtomic(paths.overrideConfig, renderOverride(paths, params),
                             kOverridePerms, owner_);
    if (!w)
        return w;
    journal.markWritten(ArtifactKind::OverrideConfig);
    spdlog::info("Wrote override config {}", paths.overrideConfig.string());

    return writeBase(mode, paths, journal);
}

} // namespace sitecache::provision
