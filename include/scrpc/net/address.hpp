#pragma once

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <cstdint>
#include <expected>
#include <stdexcept>
#include <string>
#include <string_view>

namespace scrpc::net {

/// IPv4 endpoint address (host + port)
struct ipv4_address {
    uint32_t addr = INADDR_ANY;  ///< Network byte order
    uint16_t port = 0;           ///< Host byte order

    ipv4_address() = default;

    ipv4_address(uint16_t p) : port(p) {}

    /// Construct from a numeric IP or a host name
    /// @throws std::invalid_argument if the host cannot be resolved
    ipv4_address(std::string_view host, uint16_t p) {
        auto resolved = resolve(host, p);
        if (!resolved) {
            throw std::invalid_argument("cannot resolve host '" + std::string(host) +
                                        "': " + gai_strerror(resolved.error()));
        }
        *this = *resolved;
    }

    ipv4_address(const struct sockaddr_in& sa)
        : addr(sa.sin_addr.s_addr), port(ntohs(sa.sin_port)) {}

    /// Resolve a host name or dotted quad. Empty host and "0.0.0.0" map to
    /// INADDR_ANY. On failure the getaddrinfo error code is returned.
    static std::expected<ipv4_address, int> resolve(std::string_view host, uint16_t p) {
        ipv4_address result(p);
        if (host.empty() || host == "0.0.0.0") {
            return result;
        }

        std::string host_str(host);
        if (inet_pton(AF_INET, host_str.c_str(), &result.addr) == 1) {
            return result;
        }

        struct addrinfo hints{};
        struct addrinfo* info = nullptr;
        hints.ai_family = AF_INET;
        hints.ai_socktype = SOCK_STREAM;

        int rc = getaddrinfo(host_str.c_str(), nullptr, &hints, &info);
        if (rc != 0 || info == nullptr) {
            return std::unexpected(rc != 0 ? rc : EAI_NONAME);
        }
        auto* sa = reinterpret_cast<struct sockaddr_in*>(info->ai_addr);
        result.addr = sa->sin_addr.s_addr;
        freeaddrinfo(info);
        return result;
    }

    struct sockaddr_in to_sockaddr() const {
        struct sockaddr_in sa{};
        sa.sin_family = AF_INET;
        sa.sin_addr.s_addr = addr;
        sa.sin_port = htons(port);
        return sa;
    }

    std::string to_string() const {
        char buf[INET_ADDRSTRLEN];
        struct in_addr in{};
        in.s_addr = addr;
        inet_ntop(AF_INET, &in, buf, sizeof(buf));
        return std::string(buf) + ":" + std::to_string(port);
    }

    friend bool operator==(const ipv4_address&, const ipv4_address&) = default;
};

} // namespace scrpc::net
