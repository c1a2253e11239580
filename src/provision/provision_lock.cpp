#include <sitecache/provision/provision_lock.h>

#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace sitecache::provision {

Result<ProvisionLock> ProvisionLock::acquire(const std::filesystem::path& lockFile) {
    std::error_code ec;
    std::filesystem::create_directories(lockFile.parent_path(), ec);

    int fd = ::open(lockFile.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd == -1) {
        return Error{ErrorCode::PermissionDenied, "Failed to open lock file " + lockFile.string() +
                                                      ": " + std::strerror(errno)};
    }
    if (::flock(fd, LOCK_EX | LOCK_NB) == -1) {
        int saved = errno;
        ::close(fd);
        if (saved == EWOULDBLOCK) {
            return Error{ErrorCode::OperationInProgress,
                         "Another provisioning run holds " + lockFile.string()};
        }
        return Error{ErrorCode::InternalError,
                     "Failed to lock " + lockFile.string() + ": " + std::strerror(saved)};
    }
    spdlog::debug("Acquired provisioning lock {}", lockFile.string());
    return ProvisionLock(fd);
}

ProvisionLock::ProvisionLock(ProvisionLock&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

ProvisionLock& ProvisionLock::operator=(ProvisionLock&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

ProvisionLock::~ProvisionLock() {
    release();
}

void ProvisionLock::release() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace sitecache::provision
