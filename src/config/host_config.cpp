#include <sitecache/config/config_helpers.h>
#include <sitecache/config/host_config.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <system_error>

namespace sitecache::config {

namespace {

Result<long long> parseInteger(const std::string& key, const std::string& raw) {
    long long value = 0;
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return Error{ErrorCode::ValidationError,
                     "Config key '" + key + "' expects an integer, got '" + raw + "'"};
    }
    return value;
}

Result<Port> parsePort(const std::string& key, const std::string& raw) {
    auto v = parseInteger(key, raw);
    if (!v)
        return v.error();
    if (v.value() < 1024 || v.value() > 65535) {
        return Error{ErrorCode::ValidationError,
                     "Config key '" + key + "' must be within 1024-65535, got " + raw};
    }
    return static_cast<Port>(v.value());
}

Result<std::chrono::milliseconds> parseMillis(const std::string& key, const std::string& raw) {
    auto v = parseInteger(key, raw);
    if (!v)
        return v.error();
    if (v.value() < 0) {
        return Error{ErrorCode::ValidationError, "Config key '" + key + "' must not be negative"};
    }
    return std::chrono::milliseconds(v.value());
}

Result<bool> parseFlag(const std::string& key, const std::string& raw) {
    if (auto b = parse_bool(raw))
        return *b;
    return Error{ErrorCode::ValidationError,
                 "Config key '" + key + "' expects true/false, got '" + raw + "'"};
}

} // namespace

Result<void> HostConfig::applyValues(const std::map<std::string, std::string>& values) {
    for (const auto& [key, raw] : values) {
        if (raw.empty()) {
            continue;
        }

        if (key == "paths.sites_root") {
            sitesRoot = raw;
        } else if (key == "paths.config_root") {
            configRoot = raw;
        } else if (key == "paths.site_config_dir") {
            siteConfigDir = raw;
        } else if (key == "paths.base_template") {
            baseTemplate = raw;
        } else if (key == "paths.unit_template") {
            unitTemplate = raw;
        } else if (key == "paths.unit_root") {
            unitRoot = raw;
        } else if (key == "paths.log_dir") {
            logDir = raw;
        } else if (key == "paths.run_dir") {
            runDir = raw;
        } else if (key == "paths.lock_file") {
            lockFile = raw;
        } else if (key == "naming.config_prefix") {
            configPrefix = raw;
        } else if (key == "naming.service_prefix") {
            servicePrefix = raw;
        } else if (key == "naming.alias_prefix") {
            aliasPrefix = raw;
        } else if (key == "daemon.user") {
            daemonUser = raw;
        } else if (key == "daemon.group") {
            daemonGroup = raw;
        } else if (key == "daemon.manage_ownership") {
            auto b = parseFlag(key, raw);
            if (!b)
                return b.error();
            manageOwnership = b.value();
        } else if (key == "daemon.eviction_policy") {
            evictionPolicy = raw;
        } else if (key == "daemon.default_max_memory") {
            defaultMaxMemory = raw;
        } else if (key == "ports.range_start") {
            auto p = parsePort(key, raw);
            if (!p)
                return p.error();
            portRangeStart = p.value();
        } else if (key == "ports.range_end") {
            auto p = parsePort(key, raw);
            if (!p)
                return p.error();
            portRangeEnd = p.value();
        } else if (key == "lifecycle.settle_delay_ms") {
            auto ms = parseMillis(key, raw);
            if (!ms)
                return ms.error();
            settleDelay = ms.value();
        } else if (key == "lifecycle.probe_attempts") {
            auto n = parseInteger(key, raw);
            if (!n)
                return n.error();
            probeAttempts = static_cast<int>(n.value());
        } else if (key == "lifecycle.probe_interval_ms") {
            auto ms = parseMillis(key, raw);
            if (!ms)
                return ms.error();
            probeInterval = ms.value();
        } else if (key == "lifecycle.probe_timeout_ms") {
            auto ms = parseMillis(key, raw);
            if (!ms)
                return ms.error();
            probeTimeout = ms.value();
        } else if (key == "lifecycle.probe_host") {
            probeHost = raw;
        } else if (key == "host.require_root") {
            auto b = parseFlag(key, raw);
            if (!b)
                return b.error();
            requireRoot = b.value();
        } else if (key == "integration.enabled") {
            auto b = parseFlag(key, raw);
            if (!b)
                return b.error();
            integrationEnabled = b.value();
        } else if (key == "integration.port_constant") {
            portConstant = raw;
        } else if (key == "integration.password_constant") {
            passwordConstant = raw;
        } else if (key == "integration.plugin") {
            pluginSlug = raw;
        } else {
            spdlog::warn("Ignoring unknown config key '{}'", key);
        }
    }
    return validate();
}

Result<void> HostConfig::validate() const {
    if (portRangeStart > portRangeEnd) {
        return Error{ErrorCode::ValidationError,
                     fmt::format("Port range start {} is above range end {}", portRangeStart,
                                 portRangeEnd)};
    }
    if (probeAttempts < 1) {
        return Error{ErrorCode::ValidationError, "lifecycle.probe_attempts must be at least 1"};
    }
    if (configPrefix.empty() || servicePrefix.empty() || aliasPrefix.empty()) {
        return Error{ErrorCode::ValidationError, "Naming prefixes must not be empty"};
    }
    if (evictionPolicy.empty()) {
        return Error{ErrorCode::ValidationError, "daemon.eviction_policy must not be empty"};
    }
    return {};
}

Result<HostConfig> HostConfig::load(const std::filesystem::path& path) {
    HostConfig cfg;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("Config file {} not found; using defaults", path.string());
        return cfg;
    }
    spdlog::debug("Loading host config from {}", path.string());
    if (auto r = cfg.applyValues(parse_simple_toml(path)); !r) {
        return Error{r.error().code, path.string() + ": " + r.error().message};
    }
    return cfg;
}

} // namespace sitecache::config
