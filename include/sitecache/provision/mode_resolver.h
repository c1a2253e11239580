#pragma once

#include <optional>
#include <string_view>
#include <variant>
#include <sitecache/core/types.h>
#include <sitecache/provision/instance.h>

namespace sitecache::provision {

// What the operator picked for a site that already has an instance
enum class OperatorChoice { Reconfigure, Reinstall, Cancel };

std::optional<OperatorChoice> parseOperatorChoice(std::string_view text);

// Resolved provisioning action for one run
struct FreshInstall {};
struct Reconfigure {
    Port port;
    MaxMemory maxMemory;
};
struct Reinstall {
    InstanceSummary previous;
};
struct Cancel {};

using Mode = std::variant<FreshInstall, Reconfigure, Reinstall, Cancel>;

enum class ModeKind { FreshInstall, Reconfigure, Reinstall, Cancel };

ModeKind kindOf(const Mode& mode);
const char* modeName(ModeKind kind);

/**
 * Pure decision: no existing instance always means FreshInstall; an existing
 * one requires an operator choice. Reconfigure carries the existing port and
 * memory forward and is refused when either is unknown.
 */
Result<Mode> resolveMode(const std::optional<InstanceSummary>& existing,
                         std::optional<OperatorChoice> choice);

} // namespace sitecache::provision
