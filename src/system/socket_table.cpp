#include <sitecache/system/socket_table.h>

#include <spdlog/spdlog.h>
#include <charconv>
#include <fstream>
#include <sstream>
#include <string>

namespace sitecache::system {

namespace {

constexpr std::string_view kTcpListen = "0A";
constexpr std::string_view kUdpUnconnected = "07";

std::string readWhole(const std::filesystem::path& p) {
    std::ifstream in(p);
    if (!in)
        return {};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

} // namespace

ProcNetSocketTable::ProcNetSocketTable(std::filesystem::path procNet)
    : procNet_(std::move(procNet)) {}

std::set<Port> ProcNetSocketTable::parseTable(std::string_view content, bool tcp) {
    std::set<Port> ports;
    size_t pos = 0;
    bool header = true;
    while (pos < content.size()) {
        size_t eol = content.find('\n', pos);
        if (eol == std::string_view::npos)
            eol = content.size();
        std::string_view line = content.substr(pos, eol - pos);
        pos = eol + 1;

        if (header) {
            header = false; // "  sl  local_address rem_address   st ..."
            continue;
        }

        // Columns: sl local_address rem_address st ...
        std::istringstream fields{std::string(line)};
        std::string sl, local, remote, state;
        if (!(fields >> sl >> local >> remote >> state))
            continue;
        if (state != (tcp ? kTcpListen : kUdpUnconnected))
            continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos)
            continue;
        unsigned int port = 0;
        const char* first = local.data() + colon + 1;
        const char* last = local.data() + local.size();
        auto [ptr, ec] = std::from_chars(first, last, port, 16);
        if (ec != std::errc{} || ptr != last || port == 0 || port > 65535)
            continue;
        ports.insert(static_cast<Port>(port));
    }
    return ports;
}

std::set<Port> ProcNetSocketTable::boundPorts() const {
    std::set<Port> ports;
    static constexpr std::pair<const char*, bool> kTables[] = {
        {"tcp", true}, {"tcp6", true}, {"udp", false}, {"udp6", false}};
    for (const auto& [name, tcp] : kTables) {
        auto content = readWhole(procNet_ / name);
        if (content.empty()) {
            spdlog::debug("Socket table {} unavailable", (procNet_ / name).string());
            continue;
        }
        auto parsed = parseTable(content, tcp);
        ports.insert(parsed.begin(), parsed.end());
    }
    return ports;
}

} // namespace sitecache::system
