#pragma once

#include "mediagate/common/noncopyable.h"

namespace mediagate {
namespace network {

class InetAddress;

// RAII owner of a TCP socket descriptor. Setup failures (bind, listen)
// throw std::system_error so a gateway that cannot take its port stops early.
class Socket : mediagate::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    // Non-blocking, close-on-exec IPv4 stream socket.
    static int CreateNonblocking();
    static InetAddress LocalAddress(int sockfd);

    int fd() const { return sockfd_; }

    void BindAddress(const InetAddress& localaddr);
    void Listen(int backlog);
    // Returns the accepted non-blocking fd, or -1 with errno set.
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on) { SetFlag(kTcpLevel, kNoDelay, on); }
    void SetReuseAddr(bool on) { SetFlag(kSocketLevel, kReuseAddr, on); }
    void SetReusePort(bool on) { SetFlag(kSocketLevel, kReusePort, on); }
    void SetKeepAlive(bool on) { SetFlag(kSocketLevel, kKeepAlive, on); }

private:
    enum Level { kSocketLevel, kTcpLevel };
    enum Flag { kNoDelay, kReuseAddr, kReusePort, kKeepAlive };

    void SetFlag(Level level, Flag flag, bool on);

    const int sockfd_;
};

} // namespace network
} // namespace mediagate
