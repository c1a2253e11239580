#pragma once

#include <filesystem>
#include <set>
#include <string_view>
#include <sitecache/core/types.h>

namespace sitecache::system {

/**
 * Read-only view of the host's bound sockets, independent of any instance
 * configuration.
 */
class ISocketTable {
public:
    virtual ~ISocketTable() = default;

    /// Ports with a listening TCP socket or an unconnected bound UDP socket (IPv4 or IPv6)
    virtual std::set<Port> boundPorts() const = 0;

    virtual bool isBound(Port port) const { return boundPorts().count(port) > 0; }
};

/**
 * Reads /proc/net/{tcp,tcp6,udp,udp6}. Equivalent to the port set reported by
 * `ss -tuln`: TCP sockets in LISTEN state plus unconnected UDP sockets.
 */
class ProcNetSocketTable : public ISocketTable {
public:
    explicit ProcNetSocketTable(std::filesystem::path procNet = "/proc/net");

    std::set<Port> boundPorts() const override;

    /// Parse one /proc/net table; tcp keeps LISTEN (0A) rows, udp keeps unconnected (07) rows
    static std::set<Port> parseTable(std::string_view content, bool tcp);

private:
    std::filesystem::path procNet_;
};

} // namespace sitecache::system
