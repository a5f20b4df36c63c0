#include "lock_manager.hpp"
#include "gate_error.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/file.h>
#include <unistd.h>

namespace urgate {

LockManager::LockManager(const std::string& lock_path, bool verbose)
    : lock_path_(lock_path), fd_(-1), verbose_(verbose) {
}

LockManager::~LockManager() {
    release();
}

void LockManager::acquire(Role role) {
    if (fd_ >= 0) {
        return;
    }

    // No O_CLOEXEC: the lock must survive into the exec'd tool. flock needs
    // no write access, so every account sharing the root can open the file.
    int fd = ::open(lock_path_.c_str(), O_RDONLY | O_CREAT | O_NOFOLLOW, 0644);
    if (fd < 0) {
        throw GateError(GateErrorCode::LockUnavailable,
                        "cannot open lock file " + lock_path_ + ": " + std::strerror(errno));
    }

    int operation = role == Role::Sender ? LOCK_SH : LOCK_EX;
    int rc;
    do {
        rc = ::flock(fd, operation);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        int saved = errno;
        ::close(fd);
        throw GateError(GateErrorCode::LockUnavailable,
                        "cannot lock " + lock_path_ + ": " + std::strerror(saved));
    }

    fd_ = fd;
    log(std::string(role == Role::Sender ? "shared" : "exclusive") + " lock held on " + lock_path_);
}

void LockManager::release() {
    if (fd_ < 0) {
        return;
    }
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
    fd_ = -1;
    log("lock released on " + lock_path_);
}

std::string LockManager::derive_lock_path(const std::string& lock_directory, const std::string& restricted_root) {
    std::string key = restricted_root;
    for (char& c : key) {
        if (c == '/') c = '_';
    }
    std::string dir = lock_directory;
    while (!dir.empty() && dir.back() == '/') {
        dir.pop_back();
    }
    return dir + "/ur-rsync-gate" + key + ".lock";
}

void LockManager::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[LockManager] " << message << std::endl;
    }
}

} // namespace urgate
