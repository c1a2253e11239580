#pragma once
#include <string>
#include <string_view>
#include <sitecache/core/types.h>

namespace sitecache::cli {

/**
 * Centralized error hint system for CLI.
 * Provides actionable hints based on error codes and message patterns.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * @param code The ErrorCode enum value
 * @param message The error message (used for pattern matching)
 * @param command The command that was executing (for context)
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message,
                              std::string_view command = "") {
    ErrorHint hint;

    // Pattern-based hints first
    if (message.find("journalctl") != std::string_view::npos) {
        hint.hint = "Inspect the service log for the startup failure";
        return hint;
    }

    if (message.find("reinstall") != std::string_view::npos &&
        code == ErrorCode::InvalidState) {
        hint.hint = "The existing configuration cannot be carried forward";
        hint.command = "sitecache install --mode reinstall";
        return hint;
    }

    switch (code) {
        case ErrorCode::PermissionDenied:
            hint.hint = "Run as root";
            hint.command = "sudo sitecache " + std::string(command);
            break;

        case ErrorCode::PreconditionFailed:
            hint.hint = "Install the cache server package and check [paths] in the host config";
            break;

        case ErrorCode::ValidationError:
        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = command.empty() ? "sitecache --help"
                                           : "sitecache " + std::string(command) + " --help";
            break;

        case ErrorCode::PortConflict:
            hint.hint = "Pick another port or let sitecache suggest one";
            hint.command = "sitecache list";
            break;

        case ErrorCode::ResourceExhausted:
            hint.hint = "Widen [ports] range_start/range_end in the host config";
            break;

        case ErrorCode::OperationInProgress:
            hint.hint = "Another sitecache run is active; retry when it finishes";
            break;

        case ErrorCode::WriteError:
            hint.hint = "Fix the file system problem and re-run; the listed artifacts were kept";
            break;

        case ErrorCode::ServiceStartFailed:
            hint.hint = "The service did not stay active; check its log";
            break;

        case ErrorCode::ProbeFailed:
        case ErrorCode::AuthenticationFailed:
            hint.hint = "The service runs but did not answer an authenticated PING";
            hint.command = "sitecache probe --site <site>";
            break;

        case ErrorCode::FileNotFound:
        case ErrorCode::NotFound:
            hint.hint = "List provisioned instances";
            hint.command = "sitecache list";
            break;

        default:
            break;
    }
    return hint;
}

/**
 * Format an error message with an actionable hint.
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message,
                                       std::string_view command = "") {
    auto hint = getErrorHint(code, message, command);

    std::string result(message);
    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }
    return result;
}

} // namespace sitecache::cli
