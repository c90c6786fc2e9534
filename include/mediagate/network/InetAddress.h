#pragma once

#include <netinet/in.h>
#include <string>

namespace mediagate {
namespace network {

// IPv4 endpoint.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    // `ip` must be a dotted quad; an unparsable string yields 0.0.0.0.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // getaddrinfo() lookup of `host` (name or dotted quad). Returns false if it cannot be resolved.
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace mediagate
