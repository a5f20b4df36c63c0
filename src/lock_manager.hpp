#pragma once

#include <string>
#include "gate_types.hpp"

namespace urgate {

// Advisory flock on a fixed file. Senders share, receivers are exclusive.
// The descriptor is inherited across exec so the lock stays
// held by the transfer tool until it exits.
class LockManager {
public:
    explicit LockManager(const std::string& lock_path, bool verbose = false);
    ~LockManager();

    LockManager(const LockManager&) = delete;
    LockManager& operator=(const LockManager&) = delete;

    // Blocks until granted. Throws GateError(LockUnavailable).
    void acquire(Role role);
    void release();

    bool is_held() const { return fd_ >= 0; }
    int descriptor() const { return fd_; }
    const std::string& lock_path() const { return lock_path_; }

    // <directory>/ur-rsync-gate<root with '/' as '_'>.lock
    static std::string derive_lock_path(const std::string& lock_directory, const std::string& restricted_root);

private:
    std::string lock_path_;
    int fd_;
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urgate
