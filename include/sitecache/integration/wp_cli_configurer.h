#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <sitecache/integration/application_configurer.h>
#include <sitecache/system/process.h>

namespace sitecache::integration {

/**
 * WordPress through WP-CLI. The site user owns <sites_root>/<site>; the root
 * comes from the nginx server block for the site, else ~<user>/files. All wp
 * commands run as the site user via sudo.
 */
class WpCliApplicationConfigurer : public IApplicationConfigurer {
public:
    using CommandRunner = std::function<Result<system::ProcessResult>(const system::ProcessSpec&)>;

    struct Options {
        std::filesystem::path sitesRoot{"/sites"};
        std::string wp{"wp"};
        std::string sudo{"sudo"};
        std::string nginx{"nginx"};
        std::chrono::milliseconds timeout{std::chrono::seconds(120)};
    };

    explicit WpCliApplicationConfigurer(Options options, CommandRunner runner = {});

    Result<ApplicationTarget> detect(const std::string& site) override;
    Result<void> setConstant(const ApplicationTarget& target, const std::string& name,
                             const std::string& value, bool raw) override;
    Result<PluginState> pluginState(const ApplicationTarget& target,
                                    const std::string& slug) override;
    Result<void> activatePlugin(const ApplicationTarget& target, const std::string& slug) override;
    Result<void> installPlugin(const ApplicationTarget& target, const std::string& slug) override;

    /// `root` of the first server block whose server_name line mentions `site`
    static std::optional<std::filesystem::path> findNginxRoot(std::string_view nginxDump,
                                                              std::string_view site);

private:
    Result<system::ProcessResult> wp(const ApplicationTarget& target,
                                     std::vector<std::string> args, bool redact = false) const;
    Result<std::string> ownerOf(const std::filesystem::path& path) const;

    Options options_;
    CommandRunner runner_;
};

} // namespace sitecache::integration
