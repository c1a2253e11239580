#include <sitecache/provision/instance_layout.h>

namespace sitecache::provision {

namespace {
constexpr std::string_view kOverridePrefix = "overrides.";
constexpr std::string_view kConfSuffix = ".conf";
} // namespace

InstanceLayout::InstanceLayout(const config::HostConfig& cfg)
    : sitesRoot_(cfg.sitesRoot), configRoot_(cfg.configRoot), overrideDir_(cfg.overrideDir()),
      unitRoot_(cfg.unitRoot), logDir_(cfg.logDir), runDir_(cfg.runDir),
      baseTemplate_(cfg.baseTemplate), unitTemplate_(cfg.unitTemplate),
      configPrefix_(cfg.configPrefix), servicePrefix_(cfg.servicePrefix),
      aliasPrefix_(cfg.aliasPrefix) {}

InstancePaths InstanceLayout::pathsFor(const std::string& site) const {
    InstancePaths p;
    p.siteName = site;
    p.baseConfig = configRoot_ / (configPrefix_ + "." + site + std::string(kConfSuffix));
    p.overrideConfig = overrideDir_ / (std::string(kOverridePrefix) + site + std::string(kConfSuffix));
    p.unitName = unitNameFor(site);
    p.unitFile = unitRoot_ / p.unitName;
    p.serviceAlias = aliasPrefix_ + "-" + site + ".service";
    p.pidFile = runDir_ / (servicePrefix_ + "-" + site + ".pid");
    p.logFile = logDir_ / (servicePrefix_ + "-" + site + ".log");
    p.dataFileName = "dump-" + site + ".rdb";
    return p;
}

std::optional<std::string>
InstanceLayout::siteFromOverrideFile(const std::filesystem::path& file) const {
    const std::string name = file.filename().string();
    if (name.size() <= kOverridePrefix.size() + kConfSuffix.size() ||
        !name.starts_with(kOverridePrefix) || !name.ends_with(kConfSuffix)) {
        return std::nullopt;
    }
    return name.substr(kOverridePrefix.size(),
                       name.size() - kOverridePrefix.size() - kConfSuffix.size());
}

std::string InstanceLayout::unitNameFor(std::string_view site) const {
    return servicePrefix_ + "-" + std::string(site) + ".service";
}

} // namespace sitecache::provision
