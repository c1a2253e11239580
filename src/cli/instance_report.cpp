#include <sitecache/cli/instance_report.h>
#include <sitecache/cli/ui_helpers.hpp>

#include <ostream>

namespace sitecache::cli {

namespace {
std::string stateCell(provision::LifecycleState s) {
    switch (s) {
        case provision::LifecycleState::Running:
            return ui::colorize("running", ui::Ansi::GREEN);
        case provision::LifecycleState::Stopped:
            return ui::colorize("stopped", ui::Ansi::RED);
        case provision::LifecycleState::Absent:
            return ui::colorize("absent", ui::Ansi::YELLOW);
    }
    return "unknown";
}
} // namespace

void renderInstanceTable(std::ostream& os, const std::string& title,
                         const std::vector<provision::InstanceStatus>& instances) {
    os << ui::section_header(title) << "\n";
    if (instances.empty()) {
        os << "  (none)\n";
        return;
    }
    ui::Table table;
    table.headers = {"SITE", "PORT", "MEMORY", "STATUS"};
    for (const auto& inst : instances) {
        const auto& s = inst.summary;
        table.add_row({s.siteName, s.port ? std::to_string(*s.port) : "?",
                       s.maxMemory ? s.maxMemory->toString() : "?", stateCell(inst.state)});
    }
    ui::render_table(os, table);
}

nlohmann::json instancesToJson(const std::vector<provision::InstanceStatus>& instances) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& inst : instances) {
        const auto& s = inst.summary;
        nlohmann::json j;
        j["site"] = s.siteName;
        j["port"] = s.port ? nlohmann::json(*s.port) : nlohmann::json(nullptr);
        j["maxmemory"] =
            s.maxMemory ? nlohmann::json(s.maxMemory->toString()) : nlohmann::json(nullptr);
        j["status"] = provision::lifecycleStateName(inst.state);
        j["override_config"] = s.overrideConfig.string();
        arr.push_back(std::move(j));
    }
    return arr;
}

void renderConnectionReport(std::ostream& os, const provision::ProvisionOutcome& outcome,
                            const std::string& host) {
    const auto& p = outcome.paths;
    const std::string unit = p.unitName.substr(0, p.unitName.rfind(".service"));
    const bool reconfigured = outcome.mode == provision::ModeKind::Reconfigure;

    os << "\n"
       << ui::title_banner(reconfigured ? "Cache Instance Successfully Reconfigured!"
                                        : "Cache Instance Successfully Installed!")
       << "\n\n";

    os << ui::section_header("Connection Details") << "\n";
    os << ui::key_value("Host", host, 9) << "\n";
    os << ui::key_value("Port", std::to_string(outcome.params.port), 9) << "\n";
    os << ui::key_value("Password", outcome.params.credential, 9) << "\n";
    os << ui::key_value("Memory", outcome.params.maxMemory.toString(), 9) << "\n\n";

    os << ui::section_header("Service Management") << "\n";
    os << ui::key_value("Status", "sudo systemctl status " + unit, 8) << "\n";
    os << ui::key_value("Stop", "sudo systemctl stop " + unit, 8) << "\n";
    os << ui::key_value("Start", "sudo systemctl start " + unit, 8) << "\n";
    os << ui::key_value("Restart", "sudo systemctl restart " + unit, 8) << "\n";
    os << ui::key_value("Logs", "sudo journalctl -u " + unit + " -f", 8) << "\n\n";

    os << ui::section_header("Configuration Files") << "\n";
    os << ui::key_value("Main", p.baseConfig.string(), 10) << "\n";
    os << ui::key_value("Overrides", p.overrideConfig.string(), 10) << "\n";
    os << ui::key_value("Service", p.unitFile.string(), 10) << "\n\n";

    os << ui::colorize("IMPORTANT: Save the password above - it will not be displayed again!",
                       ui::Ansi::YELLOW)
       << "\n";
}

} // namespace sitecache::cli
