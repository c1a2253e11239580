#include <sitecache/provision/unit_materializer.h>

#include <spdlog/spdlog.h>
#include <sstream>

namespace sitecache::provision {

namespace fs = std::filesystem;

namespace {
constexpr auto kUnitPerms = fs::perms::owner_read | fs::perms::owner_write |
                            fs::perms::group_read | fs::perms::others_read;

bool startsWithKey(const std::string& line, std::string_view key) {
    return line.size() >= key.size() && line.compare(0, key.size(), key) == 0;
}
} // namespace

Result<RenderedUnit> renderUnit(const std::string& stockTemplate, const InstancePaths& paths,
                                const fs::path& stockConfigPath) {
    RenderedUnit rendered;
    bool sawDescription = false;
    bool sawExecStart = false;
    bool sawPidFile = false;
    bool sawAlias = false;
    const std::string stockConfig = stockConfigPath.string();

    std::istringstream in(stockTemplate);
    std::ostringstream out;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();

        if (startsWithKey(line, "Description=")) {
            line += " for " + paths.siteName;
            sawDescription = true;
        } else if (startsWithKey(line, "ExecStart=")) {
            auto pos = line.find(stockConfig);
            if (pos == std::string::npos) {
                return Error{ErrorCode::PreconditionFailed,
                             "ExecStart in the stock unit does not reference " + stockConfig};
            }
            line.replace(pos, stockConfig.size(), paths.baseConfig.string());
            sawExecStart = true;
        } else if (startsWithKey(line, "PIDFile=")) {
            line = "PIDFile=" + paths.pidFile.string();
            sawPidFile = true;
        } else if (startsWithKey(line, "Alias=")) {
            line = "Alias=" + paths.serviceAlias;
            sawAlias = true;
        }
        out << line << '\n';
    }

    if (!sawExecStart) {
        return Error{ErrorCode::PreconditionFailed, "Stock unit has no ExecStart= line"};
    }
    if (!sawPidFile) {
        return Error{ErrorCode::PreconditionFailed, "Stock unit has no PIDFile= line"};
    }
    if (!sawDescription)
        rendered.warnings.emplace_back("Stock unit has no Description= line");
    if (!sawAlias)
        rendered.warnings.emplace_back("Stock unit has no Alias= line; " + paths.serviceAlias +
                                       " will not be registered");

    rendered.content = out.str();
    return rendered;
}

UnitMaterializer::UnitMaterializer(fs::path unitTemplate, fs::path stockConfigPath,
                                   std::optional<FileOwner> owner)
    : unitTemplate_(std::move(unitTemplate)), stockConfigPath_(std::move(stockConfigPath)),
      owner_(owner) {}

bool UnitMaterializer::keepsExistingUnit(ModeKind mode, const InstancePaths& paths) const {
    std::error_code ec;
    return mode == ModeKind::Reconfigure && fs::exists(paths.unitFile, ec);
}

Result<RenderedUnit> UnitMaterializer::render(const InstancePaths& paths) const {
    auto stock = readFile(unitTemplate_);
    if (!stock) {
        return Error{ErrorCode::PreconditionFailed,
                     "Cannot read stock service unit " + unitTemplate_.string()};
    }
    return renderUnit(stock.value(), paths, stockConfigPath_);
}

Result<void> UnitMaterializer::checkInputs(ModeKind mode, const InstancePaths& paths) const {
    if (keepsExistingUnit(mode, paths))
        return {};
    auto rendered = render(paths);
    if (!rendered)
        return rendered.error();
    return {};
}

Result<void> UnitMaterializer::materialize(ModeKind mode, const InstancePaths& paths,
                                           ArtifactJournal& journal) const {
    if (keepsExistingUnit(mode, paths)) {
        spdlog::debug("Keeping existing unit {}", paths.unitFile.string());
        journal.markUntouched(ArtifactKind::ServiceUnit);
        return {};
    }

    auto rendered = render(paths);
    if (!rendered)
        return rendered.error();
    for (const auto& w : rendered.value().warnings) {
        spdlog::warn("{}", w);
    }

    auto w = writeFileAtomic(paths.unitFile, rendered.value().content, kUnitPerms, owner_);
    if (!w)
        return w;
    journal.markWritten(ArtifactKind::ServiceUnit);
    spdlog::info("Wrote service unit {}", paths.unitFile.string());
    return {};
}

} // namespace sitecache::provision
