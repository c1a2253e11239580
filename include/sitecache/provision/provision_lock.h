#pragma once

#include <filesystem>
#include <sitecache/core/types.h>

namespace sitecache::provision {

/**
 * Host-wide advisory lock (flock) held for the commit phase of a run. Released
 * when the object is destroyed.
 */
class ProvisionLock {
public:
    /// Non-blocking; OperationInProgress when another run holds the lock
    static Result<ProvisionLock> acquire(const std::filesystem::path& lockFile);

    ProvisionLock(ProvisionLock&& other) noexcept;
    ProvisionLock& operator=(ProvisionLock&& other) noexcept;
    ProvisionLock(const ProvisionLock&) = delete;
    ProvisionLock& operator=(const ProvisionLock&) = delete;
    ~ProvisionLock();

    bool held() const { return fd_ >= 0; }

private:
    explicit ProvisionLock(int fd) : fd_(fd) {}
    void release();

    int fd_{-1};
};

} // namespace sitecache::provision
