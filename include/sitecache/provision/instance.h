#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sitecache/core/types.h>

namespace sitecache::provision {

// Memory ceiling in the daemon's "<n>M" / "<n>G" notation
struct MaxMemory {
    std::uint64_t amount{0};
    char unit{'M'}; // 'M' or 'G'

    std::string toString() const { return std::to_string(amount) + unit; }

    /// Accepts "<digits>[MmGg]"; the unit is normalized to upper case
    static Result<MaxMemory> parse(std::string_view text);

    bool operator==(const MaxMemory& other) const = default;
};

enum class LifecycleState { Running, Stopped, Absent };

constexpr const char* lifecycleStateName(LifecycleState s) {
    switch (s) {
        case LifecycleState::Running: return "running";
        case LifecycleState::Stopped: return "stopped";
        case LifecycleState::Absent: return "absent";
    }
    return "unknown";
}

// Every file-system location and name derived from a site name
struct InstancePaths {
    std::string siteName;
    std::filesystem::path baseConfig;
    std::filesystem::path overrideConfig;
    std::filesystem::path unitFile;
    std::string unitName;
    std::string serviceAlias;
    std::filesystem::path pidFile;
    std::filesystem::path logFile;
    std::string dataFileName;
};

// What the registry knows about an existing instance from its override artifact
struct InstanceSummary {
    std::string siteName;
    std::optional<Port> port;
    std::optional<MaxMemory> maxMemory;
    std::filesystem::path overrideConfig;
};

struct InstanceStatus {
    InstanceSummary summary;
    LifecycleState state{LifecycleState::Stopped};
};

/// Site names come from directory names; reject anything that could escape a directory
Result<void> validateSiteName(std::string_view site);

/// Port values accepted from an operator or caller
Result<Port> validatePortNumber(long long value);

} // namespace sitecache::provision
