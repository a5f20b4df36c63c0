#include "sandbox_guard.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <iostream>
#include <memory>
#include <unistd.h>
#include <vector>
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace urgate {

SandboxGuard::SandboxGuard(bool verbose) : verbose_(verbose) {
}

bool SandboxGuard::harden(int keep_fd) const {
    close_inherited(keep_fd);
    return set_no_new_privs();
}

bool SandboxGuard::set_no_new_privs() const {
#ifdef __linux__
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        if (verbose_) {
            std::cerr << "[SandboxGuard] PR_SET_NO_NEW_PRIVS failed: " << std::strerror(errno) << std::endl;
        }
        return false;
    }
    if (verbose_) {
        std::cerr << "[SandboxGuard] no_new_privs set" << std::endl;
    }
    return true;
#else
    return true;
#endif
}

void SandboxGuard::close_inherited(int keep_fd) const {
    std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir("/proc/self/fd"), closedir);
    if (!dir) {
        return;
    }

    // Collect first, then close outside the readdir loop
    std::vector<int> fds;
    int dir_fd = dirfd(dir.get());
    while (dirent* entry = readdir(dir.get())) {
        if (entry->d_name[0] == '.') {
            continue;
        }
        int fd = std::atoi(entry->d_name);
        if (fd > 2 && fd != keep_fd && fd != dir_fd) {
            fds.push_back(fd);
        }
    }
    for (int fd : fds) {
        ::close(fd);
    }
    if (verbose_) {
        std::cerr << "[SandboxGuard] closed " << fds.size() << " inherited descriptors" << std::endl;
    }
}

} // namespace urgate
