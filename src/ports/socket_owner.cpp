/**
 * @file socket_owner.cpp
 * @brief /proc based socket owner lookup.
 * @author BeaconMesh contributors
 */

#include "ports/socket_owner.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace beacon_mesh {

namespace {

constexpr std::string_view TCP_LISTEN_STATE = "0A";

std::string read_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // anonymous namespace

std::vector<uint64_t> listening_inodes(std::string_view proc_net_tcp, uint16_t port) {
    std::vector<uint64_t> inodes;
    std::istringstream stream{std::string(proc_net_tcp)};
    std::string line;

    // Header row
    std::getline(stream, line);

    while (std::getline(stream, line)) {
        std::istringstream iss(line);
        std::string slot, local, remote, state, queues, timer, retransmits, uid, timeout;
        uint64_t inode = 0;
        if (!(iss >> slot >> local >> remote >> state >> queues >> timer
                  >> retransmits >> uid >> timeout >> inode)) {
            continue;
        }
        if (state != TCP_LISTEN_STATE) continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;

        unsigned long local_port = 0;
        try {
            local_port = std::stoul(local.substr(colon + 1), nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (local_port == port && inode != 0) {
            inodes.push_back(inode);
        }
    }
    return inodes;
}

std::optional<std::string> find_socket_owner(uint16_t port) {
    auto inodes = listening_inodes(read_file("/proc/net/tcp"), port);
    auto v6 = listening_inodes(read_file("/proc/net/tcp6"), port);
    inodes.insert(inodes.end(), v6.begin(), v6.end());
    if (inodes.empty()) return std::nullopt;

    std::vector<std::string> targets;
    for (auto inode : inodes) {
        targets.push_back("socket:[" + std::to_string(inode) + "]");
    }

    // Processes come and go mid-scan, so every step uses the error_code overloads
    std::error_code ec;
    std::filesystem::directory_iterator proc_it("/proc", ec), end;
    for (; !ec && proc_it != end; proc_it.increment(ec)) {
        auto pid = proc_it->path().filename().string();
        if (!is_numeric(pid)) continue;

        std::error_code fd_ec;
        std::filesystem::directory_iterator fd_it(proc_it->path() / "fd", fd_ec);
        for (; !fd_ec && fd_it != end; fd_it.increment(fd_ec)) {
            std::error_code link_ec;
            auto target = std::filesystem::read_symlink(fd_it->path(), link_ec);
            if (link_ec) continue;

            if (std::find(targets.begin(), targets.end(), target.string()) != targets.end()) {
                auto comm = read_file(proc_it->path() / "comm");
                while (!comm.empty() && std::isspace(static_cast<unsigned char>(comm.back()))) {
                    comm.pop_back();
                }
                if (comm.empty()) comm = "unknown";
                return "PID " + pid + ": " + comm;
            }
        }
    }
    return std::nullopt;
}

}  // namespace beacon_mesh
