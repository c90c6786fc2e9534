#include "mediagate/network/Socket.h"
#include "mediagate/network/InetAddress.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace mediagate {
namespace network {

namespace {

[[noreturn]] void ThrowErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

const char* FlagName(int optname) {
    switch (optname) {
        case TCP_NODELAY: return "TCP_NODELAY";
        case SO_REUSEADDR: return "SO_REUSEADDR";
        case SO_REUSEPORT: return "SO_REUSEPORT";
        case SO_KEEPALIVE: return "SO_KEEPALIVE";
        default: return "?";
    }
}

} // namespace

Socket::~Socket() {
    if (::close(sockfd_) < 0) {
        LOG_WARN << "Socket close fd=" << sockfd_ << " errno=" << errno;
    }
}

int Socket::CreateNonblocking() {
    const int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) {
        ThrowErrno("socket");
    }
    return fd;
}

InetAddress Socket::LocalAddress(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << "getsockname fd=" << sockfd << " errno=" << errno;
    }
    return InetAddress(addr);
}

void Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) < 0) {
        ThrowErrno("bind " + localaddr.toIpPort());
    }
}

void Socket::Listen(int backlog) {
    if (::listen(sockfd_, backlog) < 0) {
        ThrowErrno("listen");
    }
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    const int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len,
                                 SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0 && peeraddr != nullptr) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    // ENOTCONN is routine when the peer already reset the connection.
    if (::shutdown(sockfd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_DEBUG << "shutdown(SHUT_WR) fd=" << sockfd_ << " errno=" << errno;
    }
}

void Socket::SetFlag(Level level, Flag flag, bool on) {
    static const int kOptNames[] = {TCP_NODELAY, SO_REUSEADDR, SO_REUSEPORT, SO_KEEPALIVE};
    const int optname = kOptNames[flag];
    const int optlevel = (level == kTcpLevel) ? IPPROTO_TCP : SOL_SOCKET;
    const int optval = on ? 1 : 0;
    if (::setsockopt(sockfd_, optlevel, optname, &optval, sizeof optval) < 0) {
        LOG_WARN << "setsockopt " << FlagName(optname) << " fd=" << sockfd_ << " errno=" << errno;
    }
}

} // namespace network
} // namespace mediagate
