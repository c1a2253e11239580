#pragma once

#include <memory>
#include <sitecache/core/types.h>
#include <sitecache/provision/instance_registry.h>
#include <sitecache/system/socket_table.h>

namespace sitecache::provision {

struct PortRange {
    Port first{6380};
    Port last{6400};
};

/**
 * Decides port freedom from two sources: live host sockets and ports declared
 * by existing override artifacts.
 */
class PortAllocator {
public:
    PortAllocator(const InstanceRegistry& registry, std::shared_ptr<system::ISocketTable> sockets,
                  PortRange range);

    bool isPortInUse(Port port) const;

    /// Lowest free port in the range; ResourceExhausted when none is left
    Result<Port> suggestPort() const;

    /// Range check (1024-65535) then freedom check; ValidationError or PortConflict
    Result<Port> validateCandidate(long long port) const;

    const PortRange& range() const { return range_; }

private:
    const InstanceRegistry& registry_;
    std::shared_ptr<system::ISocketTable> sockets_;
    PortRange range_;
};

} // namespace sitecache::provision
