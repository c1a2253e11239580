#include <sitecache/config/config_helpers.h>
#include <sitecache/integration/application_configurer.h>

#include <spdlog/spdlog.h>

namespace sitecache::integration {

Result<PluginPolicy> parsePluginPolicy(const std::string& text) {
    auto v = config::to_lower(text);
    if (v == "ask")
        return PluginPolicy::Ask;
    if (v == "yes" || v == "y")
        return PluginPolicy::Yes;
    if (v == "no" || v == "n")
        return PluginPolicy::No;
    return Error{ErrorCode::InvalidArgument, "Plugin policy must be ask, yes or no: " + text};
}

IntegrationReport integrateApplication(IApplicationConfigurer& configurer,
                                       const std::string& site, Port port,
                                       const std::string& credential,
                                       const IntegrationSettings& settings,
                                       const PluginConfirm& confirm) {
    IntegrationReport report;

    auto target = configurer.detect(site);
    if (!target) {
        if (target.error().code != ErrorCode::NotFound) {
            report.warnings.push_back("Application detection failed: " + target.error().message);
        } else {
            spdlog::info("No supported application for {}: {}", site, target.error().message);
        }
        return report;
    }
    report.detected = true;
    report.target = target.value();
    const auto& app = report.target;

    if (auto r = configurer.setConstant(app, settings.portConstant, std::to_string(port), true)) {
        report.applied.push_back(settings.portConstant + " set to " + std::to_string(port));
    } else {
        report.warnings.push_back("Failed to set " + settings.portConstant + ": " +
                                  r.error().message);
    }

    if (auto r = configurer.setConstant(app, settings.passwordConstant, credential, false)) {
        report.applied.push_back(settings.passwordConstant + " set");
    } else {
        report.warnings.push_back("Failed to set " + settings.passwordConstant + ": " +
                                  r.error().message);
    }

    if (settings.pluginSlug.empty() || settings.pluginPolicy == PluginPolicy::No) {
        return report;
    }

    auto state = configurer.pluginState(app, settings.pluginSlug);
    if (!state) {
        report.warnings.push_back("Could not query plugin " + settings.pluginSlug + ": " +
                                  state.error().message);
        return report;
    }
    if (state.value() == PluginState::Active) {
        report.applied.push_back("Plugin " + settings.pluginSlug + " already active");
        return report;
    }

    bool proceed = settings.pluginPolicy == PluginPolicy::Yes;
    if (settings.pluginPolicy == PluginPolicy::Ask) {
        proceed = confirm && confirm(state.value(), settings.pluginSlug);
    }
    if (!proceed) {
        spdlog::info("Plugin {} left {}", settings.pluginSlug, pluginStateName(state.value()));
        return report;
    }

    if (state.value() == PluginState::Inactive) {
        if (auto r = configurer.activatePlugin(app, settings.pluginSlug)) {
            report.applied.push_back("Plugin " + settings.pluginSlug + " activated");
        } else {
            report.warnings.push_back("Failed to activate plugin " + settings.pluginSlug + ": " +
                                      r.error().message);
        }
    } else {
        if (auto r = configurer.installPlugin(app, settings.pluginSlug)) {
            report.applied.push_back("Plugin " + settings.pluginSlug + " installed and activated");
        } else {
            report.warnings.push_back("Failed to install plugin " + settings.pluginSlug + ": " +
                                      r.error().message);
        }
    }
    return report;
}

} // namespace sitecache::integration
