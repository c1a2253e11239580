#include <sitecache/config/config_helpers.h>
#include <sitecache/integration/wp_cli_configurer.h>

#include <spdlog/spdlog.h>
#include <pwd.h>
#include <sstream>
#include <sys/stat.h>

namespace sitecache::integration {

namespace fs = std::filesystem;

namespace {
// Lines after a server_name match that are searched for a root directive
constexpr int kRootSearchWindow = 20;
} // namespace

WpCliApplicationConfigurer::WpCliApplicationConfigurer(Options options, CommandRunner runner)
    : options_(std::move(options)), runner_(std::move(runner)) {
    if (!runner_) {
        runner_ = [](const system::ProcessSpec& spec) { return system::runProcess(spec); };
    }
}

std::optional<fs::path> WpCliApplicationConfigurer::findNginxRoot(std::string_view nginxDump,
                                                                 std::string_view site) {
    std::istringstream in{std::string(nginxDump)};
    std::string line;
    int window = -1;
    while (std::getline(in, line)) {
        auto t = config::trimmed(line);
        if (t.rfind("server_name", 0) == 0 && t.find(site) != std::string::npos) {
            window = kRootSearchWindow;
            continue;
        }
        if (window <= 0)
            continue;
        --window;
        if (t.rfind("root ", 0) == 0 || t.rfind("root\t", 0) == 0) {
            auto value = config::trimmed(t.substr(5));
            while (!value.empty() && value.back() == ';')
                value.pop_back();
            value = config::trimmed(value);
            if (!value.empty())
                return fs::path(value);
        }
    }
    return std::nullopt;
}

Result<std::string> WpCliApplicationConfigurer::ownerOf(const fs::path& path) const {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return Error{ErrorCode::NotFound, "Cannot stat " + path.string()};
    }
    const passwd* pw = ::getpwuid(st.st_uid);
    if (!pw) {
        return Error{ErrorCode::NotFound, "Owner of " + path.string() + " has no account"};
    }
    return std::string(pw->pw_name);
}

Result<ApplicationTarget> WpCliApplicationConfigurer::detect(const std::string& site) {
    auto user = ownerOf(options_.sitesRoot / site);
    if (!user) {
        return Error{ErrorCode::NotFound,
                     "Could not determine site user: " + user.error().message};
    }
    ApplicationTarget target;
    target.user = user.value();
    spdlog::info("Site user: {}", target.user);

    std::error_code ec;
    auto nginx = runner_(system::ProcessSpec{{options_.nginx, "-T"}, std::nullopt,
                                             options_.timeout, false});
    if (nginx && nginx.value().ok()) {
        if (auto root = findNginxRoot(nginx.value().out, site)) {
            if (fs::exists(*root / "wp-config.php", ec)) {
                target.root = *root;
                spdlog::info("Detected WordPress root from nginx: {}", target.root.string());
            }
        }
    } else {
        spdlog::debug("nginx -T unavailable; falling back to the home directory");
    }

    if (target.root.empty()) {
        const passwd* pw = ::getpwnam(target.user.c_str());
        if (pw && pw->pw_dir) {
            fs::path files = fs::path(pw->pw_dir) / "files";
            if (fs::exists(files / "wp-config.php", ec)) {
                target.root = files;
                spdlog::info("Using standard WordPress location: {}", files.string());
            }
        }
    }
    if (target.root.empty()) {
        return Error{ErrorCode::NotFound, "Could not locate a WordPress installation"};
    }

    auto version = wp(target, {"core", "version"});
    if (!version) {
        return Error{ErrorCode::NotFound, "WP-CLI unavailable: " + version.error().message};
    }
    if (!version.value().ok()) {
        return Error{ErrorCode::NotFound, "Site is not WordPress or WP-CLI is not available"};
    }
    target.version = config::trimmed(version.value().out);
    return target;
}

Result<system::ProcessResult> WpCliApplicationConfigurer::wp(const ApplicationTarget& target,
                                                             std::vector<std::string> args,
                                                             bool redact) const {
    system::ProcessSpec spec;
    spec.argv = {options_.sudo, "-u", target.user, options_.wp, "--path=" + target.root.string()};
    spec.argv.insert(spec.argv.end(), std::make_move_iterator(args.begin()),
                     std::make_move_iterator(args.end()));
    spec.timeout = options_.timeout;
    spec.redactArgs = redact;
    return runner_(spec);
}

Result<void> WpCliApplicationConfigurer::setConstant(const ApplicationTarget& target,
                                                     const std::string& name,
                                                     const std::string& value, bool raw) {
    std::vector<std::string> args{"config", "set", name, value};
    if (raw)
        args.emplace_back("--raw");
    // The value may be a credential
    auto r = wp(target, std::move(args), !raw);
    if (!r)
        return r.error();
    if (!r.value().ok()) {
        return Error{ErrorCode::ExternalCommandFailed, config::trimmed(r.value().err)};
    }
    return {};
}

Result<PluginState> WpCliApplicationConfigurer::pluginState(const ApplicationTarget& target,
                                                            const std::string& slug) {
    auto installed = wp(target, {"plugin", "is-installed", slug});
    if (!installed)
        return installed.error();
    if (installed.value().exitCode == system::kExecFailedExitCode) {
        return Error{ErrorCode::PreconditionFailed, "WP-CLI could not be executed"};
    }
    if (!installed.value().ok())
        return PluginState::NotInstalled;

    auto active = wp(target, {"plugin", "is-active", slug});
    if (!active)
        return active.error();
    return active.value().ok() ? PluginState::Active : PluginState::Inactive;
}

Result<void> WpCliApplicationConfigurer::activatePlugin(const ApplicationTarget& target,
                                                        const std::string& slug) {
    auto r = wp(target, {"plugin", "activate", slug});
    if (!r)
        return r.error();
    if (!r.value().ok()) {
        return Error{ErrorCode::ExternalCommandFailed, config::trimmed(r.value().err)};
    }
    return {};
}

Result<void> WpCliApplicationConfigurer::installPlugin(const ApplicationTarget& target,
                                                       const std::string& slug) {
    auto r = wp(target, {"plugin", "install", slug, "--activate"});
    if (!r)
        return r.error();
    if (!r.value().ok()) {
        return Error{ErrorCode::ExternalCommandFailed, config::trimmed(r.value().err)};
    }
    return {};
}

} // namespace sitecache::integration
