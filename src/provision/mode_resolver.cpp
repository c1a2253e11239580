#include <sitecache/config/config_helpers.h>
#include <sitecache/provision/mode_resolver.h>

namespace sitecache::provision {

std::optional<OperatorChoice> parseOperatorChoice(std::string_view text) {
    auto v = config::to_lower(text);
    if (v == "reconfigure" || v == "1")
        return OperatorChoice::Reconfigure;
    if (v == "reinstall" || v == "2")
        return OperatorChoice::Reinstall;
    if (v == "cancel" || v == "3")
        return OperatorChoice::Cancel;
    return std::nullopt;
}

ModeKind kindOf(const Mode& mode) {
    if (std::holds_alternative<FreshInstall>(mode))
        return ModeKind::FreshInstall;
    if (std::holds_alternative<Reconfigure>(mode))
        return ModeKind::Reconfigure;
    if (std::holds_alternative<Reinstall>(mode))
        return ModeKind::Reinstall;
    return ModeKind::Cancel;
}

const char* modeName(ModeKind kind) {
    switch (kind) {
        case ModeKind::FreshInstall: return "fresh-install";
        case ModeKind::Reconfigure: return "reconfigure";
        case ModeKind::Reinstall: return "reinstall";
        case ModeKind::Cancel: return "cancel";
    }
    return "unknown";
}

Result<Mode> resolveMode(const std::optional<InstanceSummary>& existing,
                         std::optional<OperatorChoice> choice) {
    if (!existing) {
        return Mode{FreshInstall{}};
    }
    if (!choice) {
        return Error{ErrorCode::InvalidArgument,
                     "An instance for '" + existing->siteName +
                         "' already exists; choose reconfigure, reinstall or cancel"};
    }

    switch (*choice) {
        case OperatorChoice::Reconfigure:
            if (!existing->port || !existing->maxMemory) {
                return Error{ErrorCode::InvalidState,
                             "Existing configuration for '" + existing->siteName +
                                 "' has no readable port/maxmemory; reconfigure cannot carry them "
                                 "forward (use reinstall)"};
            }
            return Mode{Reconfigure{*existing->port, *existing->maxMemory}};
        case OperatorChoice::Reinstall:
            return Mode{Reinstall{*existing}};
        case OperatorChoice::Cancel:
            return Mode{Cancel{}};
    }
    return Error{ErrorCode::InvalidArgument, "Unknown operator choice"};
}

} // namespace sitecache::provision
