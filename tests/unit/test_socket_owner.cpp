/**
 * @file test_socket_owner.cpp
 * @brief Unit tests for /proc based socket owner lookup.
 * @author BeaconMesh contributors
 */

#include "ports/socket_owner.hpp"

#include <gtest/gtest.h>

#include <filesystem>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace beacon_mesh;

namespace {

// Port 8080 = 0x1F90, port 22 = 0x0016
constexpr const char* PROC_NET_TCP =
    "  sl  local_address rem_address   st tx_queue rx_queue tr tm->when retrnsmt   uid  timeout inode\n"
    "   0: 00000000:1F90 00000000:0000 0A 00000000:00000000 00:00000000 00000000  1000        0 41234 1 0000000000000000 100 0 0 10 0\n"
    "   1: 0100007F:0016 00000000:0000 0A 00000000:00000000 00:00000000 00000000     0        0 555 1 0000000000000000 100 0 0 10 0\n"
    "   2: 0100007F:1F90 0100007F:C350 01 00000000:00000000 00:00000000 00000000  1000        0 777 1 0000000000000000 20 4 30 10 -1\n";

}  // namespace

TEST(ListeningInodesTest, MatchesListenStateOnly) {
    auto inodes = listening_inodes(PROC_NET_TCP, 8080);
    ASSERT_EQ(inodes.size(), 1u);
    EXPECT_EQ(inodes[0], 41234u);
}

TEST(ListeningInodesTest, OtherPort) {
    auto inodes = listening_inodes(PROC_NET_TCP, 22);
    ASSERT_EQ(inodes.size(), 1u);
    EXPECT_EQ(inodes[0], 555u);
}

TEST(ListeningInodesTest, NoMatch) {
    EXPECT_TRUE(listening_inodes(PROC_NET_TCP, 9999).empty());
    EXPECT_TRUE(listening_inodes("", 8080).empty());
    EXPECT_TRUE(listening_inodes("header only\ngarbage line\n", 8080).empty());
}

TEST(FindSocketOwnerTest, FindsOwnListener) {
    if (!std::filesystem::exists("/proc/net/tcp")) {
        GTEST_SKIP() << "/proc/net/tcp not available";
    }
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    ASSERT_GE(fd, 0);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(fd, 1) != 0) {
        ::close(fd);
        GTEST_SKIP() << "Cannot bind a loopback listener";
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    uint16_t port = ntohs(addr.sin_port);

    auto owner = find_socket_owner(port);
    ::close(fd);

    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->rfind("PID " + std::to_string(::getpid()) + ":", 0), 0u);
}
