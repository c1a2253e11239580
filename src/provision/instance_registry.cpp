#include <sitecache/config/config_helpers.h>
#include <sitecache/provision/instance_registry.h>
#include <sitecache/system/service_manager.h>

#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <fstream>

namespace sitecache::provision {

namespace fs = std::filesystem;

namespace {

// Value of the first line that starts with "<keyword> "
std::optional<std::string> firstKeywordValue(const fs::path& file, std::string_view keyword) {
    std::ifstream in(file);
    if (!in)
        return std::nullopt;
    std::string line;
    while (std::getline(in, line)) {
        if (line.size() > keyword.size() && line.compare(0, keyword.size(), keyword) == 0 &&
            (line[keyword.size()] == ' ' || line[keyword.size()] == '\t')) {
            std::string value = line.substr(keyword.size() + 1);
            config::trim(value);
            return value;
        }
    }
    return std::nullopt;
}

} // namespace

InstanceRegistry::InstanceRegistry(const InstanceLayout& layout) : layout_(layout) {}

InstanceSummary InstanceRegistry::parseOverride(const std::string& site, const fs::path& file) {
    InstanceSummary s;
    s.siteName = site;
    s.overrideConfig = file;

    if (auto port = firstKeywordValue(file, "port")) {
        long long value = 0;
        auto [ptr, ec] = std::from_chars(port->data(), port->data() + port->size(), value);
        if (ec == std::errc{} && ptr == port->data() + port->size()) {
            if (auto p = validatePortNumber(value)) {
                s.port = p.value();
            }
        }
        if (!s.port) {
            spdlog::debug("{}: unparsable port '{}'", file.string(), *port);
        }
    }

    if (auto mem = firstKeywordValue(file, "maxmemory")) {
        if (auto m = MaxMemory::parse(*mem)) {
            s.maxMemory = m.value();
        } else {
            spdlog::debug("{}: unparsable maxmemory '{}'", file.string(), *mem);
        }
    }
    return s;
}

std::vector<InstanceSummary> InstanceRegistry::listInstances() const {
    std::vector<InstanceSummary> out;
    std::error_code ec;
    if (!fs::is_directory(layout_.overrideDir(), ec)) {
        return out;
    }

    for (const auto& entry : fs::directory_iterator(layout_.overrideDir(), ec)) {
        if (!entry.is_regular_file(ec))
            continue;
        auto site = layout_.siteFromOverrideFile(entry.path());
        if (!site)
            continue;
        out.push_back(parseOverride(*site, entry.path()));
    }
    if (ec) {
        spdlog::warn("Error scanning {}: {}", layout_.overrideDir().string(), ec.message());
    }

    std::sort(out.begin(), out.end(),
              [](const InstanceSummary& a, const InstanceSummary& b) { return a.siteName < b.siteName; });
    return out;
}

std::optional<InstanceSummary> InstanceRegistry::lookup(const std::string& site) const {
    auto file = layout_.pathsFor(site).overrideConfig;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    return parseOverride(site, file);
}

Result<std::string> InstanceRegistry::readCredential(const std::string& site) const {
    auto file = layout_.pathsFor(site).overrideConfig;
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return Error{ErrorCode::NotFound, "No instance found for site '" + site + "'"};
    }
    auto value = firstKeywordValue(file, "requirepass");
    if (!value || value->empty()) {
        return Error{ErrorCode::InvalidData, file.string() + " has no requirepass entry"};
    }
    return config::unquote(*value);
}

std::vector<std::string> InstanceRegistry::listSites() const {
    std::vector<std::string> sites;
    std::error_code ec;
    if (!fs::is_directory(layout_.sitesRoot(), ec)) {
        return sites;
    }
    for (const auto& entry : fs::directory_iterator(layout_.sitesRoot(), ec)) {
        if (entry.is_directory(ec)) {
            sites.push_back(entry.path().filename().string());
        }
    }
    std::sort(sites.begin(), sites.end());
    return sites;
}

std::vector<InstanceStatus> InstanceRegistry::report(system::IServiceManager& services) const {
    std::vector<InstanceStatus> rows;
    for (auto& summary : listInstances()) {
        InstanceStatus row;
        const auto paths = layout_.pathsFor(summary.siteName);
        std::error_code ec;
        if (!fs::exists(paths.unitFile, ec)) {
            row.state = LifecycleState::Absent;
        } else if (auto active = services.isActive(paths.unitName); active && active.value()) {
            row.state = LifecycleState::Running;
        } else {
            if (!active) {
                spdlog::debug("Status query for {} failed: {}", paths.unitName,
                              active.error().message);
            }
            row.state = LifecycleState::Stopped;
        }
        row.summary = std::move(summary);
        rows.push_back(std::move(row));
    }
    return rows;
}

} // namespace sitecache::provision
