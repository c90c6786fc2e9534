#include "mediagate/network/Connector.h"
#include "mediagate/network/Channel.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/Socket.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace mediagate {
namespace network {

namespace {

int PendingSocketError(int fd) {
    int err = 0;
    socklen_t len = sizeof err;
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        return errno;
    }
    return err;
}

} // namespace

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop),
      serverAddr_(serverAddr) {
}

Connector::~Connector() {
    if (channel_) {
        ::close(ReleaseChannel());
    }
}

void Connector::Start() {
    std::shared_ptr<Connector> self(shared_from_this());
    loop_->RunInLoop([self]() {
        self->wanted_ = true;
        if (self->phase_ != kInProgress) self->Begin();
    });
}

void Connector::Stop() {
    std::shared_ptr<Connector> self(shared_from_this());
    loop_->QueueInLoop([self]() {
        self->wanted_ = false;
        if (self->phase_ == kInProgress) {
            ::close(self->ReleaseChannel());
            self->phase_ = kIdle;
        }
    });
}

void Connector::Begin() {
    int fd = -1;
    try {
        fd = Socket::CreateNonblocking();
    } catch (const std::system_error& e) {
        LOG_ERROR << "connect to " << serverAddr_.toIpPort() << ": " << e.what();
        phase_ = kFinished;
        if (onResult_) onResult_(-1, e.code().value());
        return;
    }

    phase_ = kInProgress;
    channel_.reset(new Channel(loop_, fd));
    channel_->SetWriteCallback([this]() { OnWritable(); });
    channel_->SetErrorCallback([this]() { OnWritable(); });

    const int rc = ::connect(fd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int err = rc == 0 ? 0 : errno;
    if (err == 0 || err == EINPROGRESS || err == EINTR || err == EISCONN) {
        // Completion (or failure) shows up as writability.
        channel_->EnableWriting();
        return;
    }
    Finish(err);
}

void Connector::OnWritable() {
    if (phase_ != kInProgress) {
        return;
    }
    Finish(PendingSocketError(channel_->fd()));
}

// Single exit for an attempt: hands the fd over or closes it.
void Connector::Finish(int err) {
    const int fd = ReleaseChannel();
    phase_ = kFinished;
    if (err != 0) {
        ::close(fd);
        LOG_WARN << "connect to " << serverAddr_.toIpPort() << " failed: " << std::strerror(err);
        if (wanted_ && onResult_) onResult_(-1, err);
        return;
    }
    if (wanted_ && onResult_) {
        onResult_(fd, 0);
    } else {
        ::close(fd);
    }
}

int Connector::ReleaseChannel() {
    channel_->DisableAll();
    channel_->Remove();
    const int fd = channel_->fd();
    // May be running inside this channel's own dispatch.
    Channel* dead = channel_.release();
    loop_->QueueInLoop([dead]() { delete dead; });
    return fd;
}

} // namespace network
} // namespace mediagate
