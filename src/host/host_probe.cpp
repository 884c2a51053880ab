/**
 * @file host_probe.cpp
 * @brief Host probing from POSIX calls and Linux pseudo-filesystems.
 * @author BeaconMesh contributors
 */

#include "host/host_probe.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <fstream>
#include <ifaddrs.h>
#include <iomanip>
#include <netinet/in.h>
#include <random>
#include <sstream>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>

namespace beacon_mesh {

namespace {

int second_octet(const std::string& ip) {
    auto first_dot = ip.find('.');
    if (first_dot == std::string::npos) return 256;
    auto second_dot = ip.find('.', first_dot + 1);
    try {
        return std::stoi(ip.substr(first_dot + 1, second_dot - first_dot - 1));
    } catch (const std::exception&) {
        return 256;
    }
}

std::string read_file(const std::string& path) {
    std::ifstream ifs(path);
    std::ostringstream oss;
    oss << ifs.rdbuf();
    return oss.str();
}

}  // anonymous namespace

std::string local_hostname() {
    char buf[256] = {};
    if (::gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
        return "localhost";
    }
    return std::string(buf);
}

std::vector<std::string> local_ipv4_addresses() {
    std::vector<std::string> result;

    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) return result;

    for (auto* ifa = list; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) continue;

        char ip_buf[INET_ADDRSTRLEN];
        const auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        if (::inet_ntop(AF_INET, &sin->sin_addr, ip_buf, sizeof(ip_buf)) != nullptr) {
            result.emplace_back(ip_buf);
        }
    }

    ::freeifaddrs(list);
    return result;
}

std::string select_primary_ip(const std::vector<std::string>& candidates) {
    std::vector<std::string> external;
    for (const auto& ip : candidates) {
        if (!ip.starts_with("127.")) external.push_back(ip);
    }

    for (const auto& ip : external) {
        if (ip.starts_with("10.")) return ip;
    }
    for (const auto& ip : external) {
        if (ip.starts_with("192.168.")) return ip;
    }

    std::vector<std::string> private_172;
    for (const auto& ip : external) {
        if (ip.starts_with("172.")) private_172.push_back(ip);
    }
    if (!private_172.empty()) {
        std::stable_sort(private_172.begin(), private_172.end(),
            [](const std::string& a, const std::string& b) {
                return second_octet(a) < second_octet(b);
            });
        return private_172.front();
    }

    if (!external.empty()) return external.front();
    return "127.0.0.1";
}

std::string primary_ip() {
    return select_primary_ip(local_ipv4_addresses());
}

MachineId generate_machine_id(std::string_view hostname) {
    std::string base;
    base.reserve(hostname.size());
    for (char c : hostname) {
        base.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (base.empty()) base = "host";

    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<uint32_t> dist;

    std::ostringstream oss;
    oss << base << '-' << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
    return oss.str();
}

Capabilities parse_meminfo(std::string_view meminfo_text) {
    Capabilities caps;
    std::istringstream stream{std::string(meminfo_text)};
    std::string line;
    while (std::getline(stream, line)) {
        if (line.starts_with("MemTotal:")) {
            std::istringstream iss(line.substr(9));
            uint64_t kb = 0;
            iss >> kb;
            caps.memory_total_bytes = kb * 1024;
        } else if (line.starts_with("MemAvailable:")) {
            std::istringstream iss(line.substr(13));
            uint64_t kb = 0;
            iss >> kb;
            caps.memory_available_bytes = kb * 1024;
        }
    }
    return caps;
}

Capabilities probe_capabilities() {
    auto caps = parse_meminfo(read_file("/proc/meminfo"));
    caps.cpu_cores = std::thread::hardware_concurrency();

    utsname uts{};
    if (::uname(&uts) == 0) {
        caps.platform = std::string(uts.sysname) + " " + uts.release + " " + uts.machine;
    }
    return caps;
}

MachineDescriptor describe_local_machine(const NodeConfig& node) {
    MachineDescriptor local;
    local.hostname = node.hostname.empty() ? local_hostname() : node.hostname;
    local.machine_id = node.machine_id.empty() ? generate_machine_id(local.hostname)
                                               : node.machine_id;
    local.cluster_name = node.cluster_name.empty() ? "mesh-" + local.hostname
                                                   : node.cluster_name;
    local.primary_ip = primary_ip();
    local.advertised_services = node.services;
    local.capabilities = probe_capabilities();
    local.status = MachineStatus::Online;
    return local;
}

}  // namespace beacon_mesh
