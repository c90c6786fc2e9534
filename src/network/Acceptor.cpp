#include "mediagate/network/Acceptor.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/InetAddress.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace mediagate {
namespace network {

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : socket_(Socket::CreateNonblocking()),
      channel_(loop, socket_.fd()),
      idleFd_(::open("/dev/null", O_RDONLY | O_CLOEXEC)) {
    socket_.SetReuseAddr(true);
    socket_.SetReusePort(reuseport);
    socket_.BindAddress(listenAddr);
    channel_.SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
}

Acceptor::~Acceptor() {
    channel_.DisableAll();
    channel_.Remove();
    if (idleFd_ >= 0) {
        ::close(idleFd_);
    }
}

void Acceptor::Listen() {
    socket_.Listen(kBacklog);
    listening_ = true;
    channel_.EnableReading();
    LOG_DEBUG << "Listening on " << Socket::LocalAddress(socket_.fd()).toIpPort();
}

void Acceptor::HandleRead() {
    for (int i = 0; i < kMaxAcceptsPerEvent; ++i) {
        InetAddress peer;
        const int connfd = socket_.Accept(&peer);
        if (connfd < 0) {
            const int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                return;
            }
            if (err == ECONNABORTED || err == EINTR) {
                continue;
            }
            if (err == EMFILE || err == ENFILE) {
                LOG_ERROR << "accept: descriptor limit reached, shedding one connection";
                ShedOneConnection();
                return;
            }
            LOG_ERROR << "accept errno=" << err;
            return;
        }

        if (onNewConnection_) {
            onNewConnection_(connfd, peer);
        } else {
            ::close(connfd);
        }
    }
}

// Level-triggered epoll would spin on a full fd table; free the spare slot,
// accept and drop the pending peer, then reserve the slot again.
void Acceptor::ShedOneConnection() {
    if (idleFd_ < 0) {
        return;
    }
    ::close(idleFd_);
    const int fd = ::accept(socket_.fd(), nullptr, nullptr);
    if (fd >= 0) {
        ::close(fd);
    }
    idleFd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace network
} // namespace mediagate
