#include <sitecache/provision/port_allocator.h>

#include <spdlog/spdlog.h>
#include <set>

namespace sitecache::provision {

PortAllocator::PortAllocator(const InstanceRegistry& registry,
                             std::shared_ptr<system::ISocketTable> sockets, PortRange range)
    : registry_(registry), sockets_(std::move(sockets)), range_(range) {}

bool PortAllocator::isPortInUse(Port port) const {
    if (sockets_ && sockets_->isBound(port)) {
        spdlog::debug("Port {} has a live socket", port);
        return true;
    }
    for (const auto& inst : registry_.listInstances()) {
        if (inst.port && *inst.port == port) {
            spdlog::debug("Port {} is declared by instance {}", port, inst.siteName);
            return true;
        }
    }
    return false;
}

Result<Port> PortAllocator::suggestPort() const {
    // One snapshot of both sources for the whole scan
    std::set<Port> taken = sockets_ ? sockets_->boundPorts() : std::set<Port>{};
    for (const auto& inst : registry_.listInstances()) {
        if (inst.port)
            taken.insert(*inst.port);
    }

    for (unsigned int p = range_.first; p <= range_.last; ++p) {
        if (taken.count(static_cast<Port>(p)) == 0) {
            return static_cast<Port>(p);
        }
    }
    return Error{ErrorCode::ResourceExhausted,
                 fmt::format("Could not find available port between {}-{}", range_.first,
                             range_.last)};
}

Result<Port> PortAllocator::validateCandidate(long long port) const {
    auto p = validatePortNumber(port);
    if (!p) {
        return p.error();
    }
    if (isPortInUse(p.value())) {
        return Error{ErrorCode::PortConflict,
                     fmt::format("Port {} is already in use. Please choose another port.",
                                 p.value())};
    }
    return p.value();
}

} // namespace sitecache::provision
