/**
 * @file port_probe.cpp
 * @brief SystemPortProbe implementation.
 * @author BeaconMesh contributors
 */

#include "ports/port_probe.hpp"
#include "ports/socket_owner.hpp"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace beacon_mesh {

bool SystemPortProbe::is_available(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        logger_.warn("ports", "Probe socket failed for port " + std::to_string(port)
                              + ": " + std::strerror(errno));
        return true;
    }

    int optval = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = INADDR_ANY;

    bool available = true;
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0
        || ::listen(fd, 1) < 0) {
        int err = errno;
        if (err == EADDRINUSE) {
            available = false;
        } else {
            logger_.warn("ports", "Probe bind on port " + std::to_string(port)
                                  + " failed: " + std::strerror(err)
                                  + "; treating as available");
        }
    }

    ::close(fd);
    return available;
}

std::optional<std::string> SystemPortProbe::describe_owner(uint16_t port) {
    return find_socket_owner(port);
}

}  // namespace beacon_mesh
