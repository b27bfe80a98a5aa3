#include "infrastructure/network/PingService.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <random>

#ifdef __linux__
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace apcups::infra {

namespace {

constexpr uint8_t ICMP_ECHO_REQUEST = 8;
constexpr uint8_t ICMP_ECHO_REPLY = 0;

#ifdef __linux__
std::string resolveHostname(const std::string& hostname) {
    struct addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_RAW;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0) {
        return hostname;
    }

    char ipStr[INET_ADDRSTRLEN];
    auto* addr = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    inet_ntop(AF_INET, &addr->sin_addr, ipStr, INET_ADDRSTRLEN);
    freeaddrinfo(result);

    return ipStr;
}

// Closes the descriptor on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};
#endif

} // namespace

PingService::PingService() {
    std::random_device rd;
    identifier_ = static_cast<uint16_t>(rd() & 0xFFFF);
    spdlog::debug("PingService initialized with identifier: {}", identifier_);
}

uint16_t PingService::calculateChecksum(const uint8_t* data, size_t length) {
    uint32_t sum = 0;

    while (length > 1) {
        sum += (static_cast<uint16_t>(data[0]) << 8) | data[1];
        data += 2;
        length -= 2;
    }

    if (length == 1) {
        sum += static_cast<uint16_t>(data[0]) << 8;
    }

    while (sum >> 16) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }

    return static_cast<uint16_t>(~sum);
}

std::vector<uint8_t> PingService::buildIcmpEchoRequest(uint16_t identifier, uint16_t sequence) {
    std::vector<uint8_t> packet(64, 0);

    packet[0] = ICMP_ECHO_REQUEST;
    packet[1] = 0;
    packet[4] = static_cast<uint8_t>(identifier >> 8);
    packet[5] = static_cast<uint8_t>(identifier & 0xFF);
    packet[6] = static_cast<uint8_t>(sequence >> 8);
    packet[7] = static_cast<uint8_t>(sequence & 0xFF);

    // Timestamp as payload
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    std::memcpy(&packet[8], &now, sizeof(now));

    uint16_t checksum = calculateChecksum(packet.data(), packet.size());
    packet[2] = static_cast<uint8_t>(checksum >> 8);
    packet[3] = static_cast<uint8_t>(checksum & 0xFF);

    return packet;
}

core::PingResult PingService::ping(const std::string& address, std::chrono::milliseconds timeout) {
    core::PingResult result;
    result.timestamp = std::chrono::system_clock::now();
    result.success = false;

#ifdef __linux__
    std::string resolvedAddress = resolveHostname(address);

    struct sockaddr_in dest {};
    dest.sin_family = AF_INET;
    if (inet_pton(AF_INET, resolvedAddress.c_str(), &dest.sin_addr) != 1) {
        result.errorMessage = "Invalid address: " + address;
        return result;
    }

    SocketGuard sock(socket(AF_INET, SOCK_RAW, IPPROTO_ICMP));
    if (sock.get() < 0) {
        result.errorMessage = "Failed to create raw socket (need CAP_NET_RAW)";
        spdlog::warn("Ping to {} failed: {}", address, result.errorMessage);
        return result;
    }

    uint16_t seq = sequenceNumber_++;
    auto packet = buildIcmpEchoRequest(identifier_, seq);

    auto sendTime = std::chrono::steady_clock::now();
    auto deadline = sendTime + timeout;

    ssize_t sent = sendto(sock.get(), packet.data(), packet.size(), 0,
                          reinterpret_cast<struct sockaddr*>(&dest), sizeof(dest));
    if (sent < 0) {
        result.errorMessage = "Failed to send ICMP packet";
        return result;
    }

    std::array<uint8_t, 1024> recvBuffer{};

    // A raw socket sees every ICMP packet on the host; wait for ours
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.errorMessage = "Timeout";
            return result;
        }

        struct pollfd pfd {};
        pfd.fd = sock.get();
        pfd.events = POLLIN;
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready == 0) {
            result.errorMessage = "Timeout";
            return result;
        }
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.errorMessage = "Receive error: " + std::string(std::strerror(errno));
            return result;
        }

        struct sockaddr_in from {};
        socklen_t fromLen = sizeof(from);
        ssize_t received = recvfrom(sock.get(), recvBuffer.data(), recvBuffer.size(), 0,
                                    reinterpret_cast<struct sockaddr*>(&from), &fromLen);
        auto recvTime = std::chrono::steady_clock::now();

        if (received < 28) { // Minimum IP header (20) + ICMP header (8)
            continue;
        }

        auto* ipHeader = recvBuffer.data();
        size_t ipHeaderLen = static_cast<size_t>((ipHeader[0] & 0x0F) * 4);
        if (ipHeaderLen + 8 > static_cast<size_t>(received)) {
            continue;
        }
        auto* icmpHeader = recvBuffer.data() + ipHeaderLen;

        if (icmpHeader[0] != ICMP_ECHO_REPLY) {
            continue;
        }

        uint16_t recvId = (static_cast<uint16_t>(icmpHeader[4]) << 8) | icmpHeader[5];
        uint16_t recvSeq = (static_cast<uint16_t>(icmpHeader[6]) << 8) | icmpHeader[7];
        if (recvId != identifier_ || recvSeq != seq) {
            continue;
        }

        result.success = true;
        result.latency =
            std::chrono::duration_cast<std::chrono::microseconds>(recvTime - sendTime);
        result.ttl = ipHeader[8];

        spdlog::debug("Ping to {} successful: {:.2f}ms TTL={}", address, result.latencyMs(),
                      *result.ttl);
        return result;
    }
#else
    (void)address;
    (void)timeout;
    result.errorMessage = "ICMP ping not implemented for this platform";
    return result;
#endif
}

} // namespace apcups::infra
