#include "server/PortReclaimer.hpp"

#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>

namespace walletgate::server {

namespace fs = std::filesystem;

namespace {

constexpr const char* TCP_LISTEN_STATE = "0A";

std::optional<unsigned long> scanTable(const std::string& path, uint16_t port) {
    std::ifstream table(path);
    if (!table) {
        return std::nullopt;
    }

    std::string line;
    std::getline(table, line); // заголовок
    while (std::getline(table, line)) {
        std::istringstream ss(line);
        std::string slot, local, remote, state, queues, timer, retransmit, uid, timeout;
        unsigned long inode = 0;
        if (!(ss >> slot >> local >> remote >> state >> queues >> timer >> retransmit >> uid >> timeout >> inode)) {
            continue;
        }
        if (state != TCP_LISTEN_STATE) {
            continue;
        }
        auto colon = local.rfind(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (std::stoul(local.substr(colon + 1), nullptr, 16) == port && inode != 0) {
            return inode;
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<unsigned long> ProcPortReclaimer::findListeningInode(uint16_t port) {
    if (auto inode = scanTable("/proc/net/tcp", port)) {
        return inode;
    }
    return scanTable("/proc/net/tcp6", port);
}

std::optional<pid_t> ProcPortReclaimer::findOwner(unsigned long inode) {
    const std::string needle = "socket:[" + std::to_string(inode) + "]";
    std::error_code ec;

    for (const auto& proc : fs::directory_iterator("/proc", ec)) {
        const auto name = proc.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }

        std::error_code fdEc;
        for (const auto& fd : fs::directory_iterator(proc.path() / "fd", fdEc)) {
            std::error_code linkEc;
            auto target = fs::read_symlink(fd.path(), linkEc);
            if (!linkEc && target.string() == needle) {
                return static_cast<pid_t>(std::stol(name));
            }
        }
    }
    return std::nullopt;
}

bool ProcPortReclaimer::reclaim(uint16_t port) {
    auto inode = findListeningInode(port);
    if (!inode) {
        std::cout << "[PortReclaimer] No listener found on port " << port << std::endl;
        return false;
    }

    auto pid = findOwner(*inode);
    if (!pid) {
        std::cout << "[PortReclaimer] Listener on port " << port
                  << " belongs to a process we cannot inspect" << std::endl;
        return false;
    }
    if (*pid == ::getpid()) {
        std::cout << "[PortReclaimer] Port " << port << " is held by this process, not touching it" << std::endl;
        return false;
    }

    std::cout << "[PortReclaimer] Stopping stale process " << *pid << " on port " << port << std::endl;
    return terminate(*pid);
}

bool ProcPortReclaimer::terminate(pid_t pid) const {
    if (::kill(pid, SIGTERM) != 0) {
        std::cerr << "[PortReclaimer] SIGTERM to " << pid << " failed" << std::endl;
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (::kill(pid, 0) != 0) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }

    std::cout << "[PortReclaimer] Process " << pid << " ignored SIGTERM, sending SIGKILL" << std::endl;
    return ::kill(pid, SIGKILL) == 0;
}

} // namespace walletgate::server
