#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <sitecache/core/types.h>

namespace sitecache::system {

struct ProcessSpec {
    std::vector<std::string> argv; // argv[0] is resolved through PATH
    std::optional<std::filesystem::path> workdir;
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    bool redactArgs{false}; // argv carries a secret; log only the executable
};

struct ProcessResult {
    int exitCode{-1};
    std::string out;
    std::string err;

    bool ok() const { return exitCode == 0; }
};

/// Exit code reported when the executable could not be exec'd
inline constexpr int kExecFailedExitCode = 127;

/**
 * Run a child process to completion, capturing stdout and stderr.
 * A non-zero exit is reported in ProcessResult, not as an error; errors are
 * reserved for spawn failures and timeouts (the child is killed on timeout).
 */
Result<ProcessResult> runProcess(const ProcessSpec& spec);

/// Render argv for log lines (no quoting beyond spaces)
std::string describeCommand(const std::vector<std::string>& argv);

} // namespace sitecache::system
