#include "mediagate/network/TcpConnection.h"
#include "mediagate/network/Channel.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/Socket.h"
#include "mediagate/network/TlsStream.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace mediagate {
namespace network {

namespace {

const size_t kShrinkThreshold = 4 * 1024 * 1024;
const size_t kTlsReadChunk = 16 * 1024;
// First byte of a TLS record carrying a ClientHello.
const unsigned char kTlsHandshakeRecord = 0x16;

bool IsPeerGone(int err) {
    return err == EPIPE || err == ECONNRESET;
}

bool WouldBlock(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

} // namespace

const char* TcpConnection::StateName(State s) {
    switch (s) {
        case kConnecting: return "connecting";
        case kConnected: return "connected";
        case kDisconnecting: return "disconnecting";
        case kDisconnected: return "disconnected";
    }
    return "?";
}

TcpConnection::TcpConnection(EventLoop* loop,
                             std::string name,
                             int sockfd,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* tlsCtx)
    : loop_(loop),
      name_(std::move(name)),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      peerAddr_(peerAddr),
      tlsCtx_(tlsCtx) {
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point t) { HandleRead(t); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });
    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    Touch();
    LOG_DEBUG << "conn " << name_ << " created fd=" << sockfd;
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "conn " << name_ << " destroyed in state " << StateName(state_.load());
}

void TcpConnection::ConnectEstablished() {
    state_ = kConnected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();
    if (onConnection_) {
        onConnection_(shared_from_this());
    }
}

void TcpConnection::ConnectDestroyed() {
    const State prev = state_.exchange(kDisconnected);
    if (prev == kConnected || prev == kDisconnecting) {
        channel_->DisableAll();
        if (onConnection_) {
            onConnection_(shared_from_this());
        }
    }
    channel_->Remove();
}

// Peeks at the first byte. Returns false until it has arrived.
bool TcpConnection::DetectTransport() {
    unsigned char first = 0;
    if (::recv(channel_->fd(), &first, 1, MSG_PEEK) != 1) {
        return false;
    }
    ssl_ctx_st* ctx = tlsCtx_;
    tlsCtx_ = nullptr;
    if (first != kTlsHandshakeRecord) {
        if (output_.ReadableBytes() > 0) channel_->EnableWriting();
        return true;
    }
    tls_ = TlsStream::Accept(ctx, channel_->fd());
    if (!tls_) {
        LOG_ERROR << "conn " << name_ << ": cannot allocate a TLS session";
        HandleClose();
        return false;
    }
    return true;
}

// Returns true once application data may flow.
bool TcpConnection::AdvanceHandshake() {
    switch (tls_->Handshake()) {
        case TlsStream::kDone:
            LOG_DEBUG << "conn " << name_ << " TLS established";
            if (output_.ReadableBytes() > 0) {
                if (!channel_->IsWriting()) channel_->EnableWriting();
            } else if (channel_->IsWriting()) {
                channel_->DisableWriting();
            }
            return true;
        case TlsStream::kWantRead:
            return false;
        case TlsStream::kWantWrite:
            if (!channel_->IsWriting()) channel_->EnableWriting();
            return false;
        case TlsStream::kEof:
        case TlsStream::kError:
            break;
    }
    LOG_WARN << "TLS handshake with " << peerAddr_.toIpPort() << " failed: " << tls_->lastError();
    HandleClose();
    return false;
}

// > 0 bytes appended, 0 on orderly close, -1 with *err set (EAGAIN when
// nothing is available yet).
ssize_t TcpConnection::ReadInput(int* err) {
    if (!tls_) {
        return input_.ReadFd(channel_->fd(), err);
    }
    // Drain every decrypted record: epoll cannot see data already inside OpenSSL.
    ssize_t total = 0;
    TlsStream::Status status = TlsStream::kDone;
    for (;;) {
        input_.EnsureWritableBytes(kTlsReadChunk);
        const ssize_t n = tls_->Read(input_.BeginWrite(), input_.WritableBytes(), &status);
        if (n <= 0) break;
        input_.HasWritten(static_cast<size_t>(n));
        total += n;
    }
    if (total > 0) {
        return total;
    }
    switch (status) {
        case TlsStream::kEof:
            return 0;
        case TlsStream::kWantWrite:
            if (!channel_->IsWriting()) channel_->EnableWriting();
            *err = EAGAIN;
            return -1;
        case TlsStream::kWantRead:
            *err = EAGAIN;
            return -1;
        default:
            LOG_DEBUG << "conn " << name_ << " TLS read: " << tls_->lastError();
            *err = EIO;
            return -1;
    }
}

// Bytes accepted by the kernel or TLS layer, 0 when it would block, -1 on
// a broken connection.
ssize_t TcpConnection::Transmit(const void* data, size_t len, int* err) {
    if (tls_) {
        TlsStream::Status status;
        const ssize_t n = tls_->Write(data, len, &status);
        if (n > 0) return n;
        if (status == TlsStream::kWantRead || status == TlsStream::kWantWrite) return 0;
        *err = EPIPE;
        return -1;
    }
    const ssize_t n = ::send(channel_->fd(), data, len, MSG_NOSIGNAL);
    if (n >= 0) return n;
    if (WouldBlock(errno)) return 0;
    *err = errno;
    return -1;
}

void TcpConnection::HandleRead(std::chrono::system_clock::time_point receiveTime) {
    if (tlsCtx_ != nullptr && !DetectTransport()) {
        return;
    }
    if (tls_ && !tls_->established() && !AdvanceHandshake()) {
        return;
    }

    int err = 0;
    const ssize_t n = ReadInput(&err);
    if (n > 0) {
        Touch();
        if (onMessage_) {
            onMessage_(shared_from_this(), &input_, receiveTime);
        }
        return;
    }
    if (n < 0 && WouldBlock(err)) {
        return;
    }
    if (n < 0) {
        if (IsPeerGone(err)) {
            LOG_DEBUG << "conn " << name_ << " reset by peer";
        } else {
            LOG_ERROR << "conn " << name_ << " read failed errno=" << err;
        }
    }
    HandleClose();
}

void TcpConnection::HandleWrite() {
    if (tls_ && !tls_->established()) {
        AdvanceHandshake();
        return;
    }
    if (!channel_->IsWriting()) {
        return;
    }
    if (output_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        return;
    }

    int err = 0;
    const ssize_t n = Transmit(output_.Peek(), output_.ReadableBytes(), &err);
    if (n < 0) {
        LOG_DEBUG << "conn " << name_ << " write failed errno=" << err;
        HandleClose();
        return;
    }
    if (n == 0) {
        return;
    }

    Touch();
    output_.Retrieve(static_cast<size_t>(n));
    if (output_.ReadableBytes() > 0) {
        return;
    }
    channel_->DisableWriting();
    // A burst of media chunks can leave megabytes of idle capacity behind.
    if (output_.Capacity() > kShrinkThreshold) {
        output_.Shrink(0);
    }
    QueueWriteComplete();
    if (state_ == kDisconnecting) {
        ShutdownInLoop();
    }
}

void TcpConnection::HandleClose() {
    if (state_.exchange(kDisconnected) == kDisconnected) {
        return;
    }
    LOG_DEBUG << "conn " << name_ << " closing fd=" << channel_->fd();
    channel_->DisableAll();

    TcpConnectionPtr self(shared_from_this());
    if (onConnection_) {
        onConnection_(self);
    }
    if (onClose_) {
        onClose_(self);
    }
}

void TcpConnection::HandleError() {
    int soError = 0;
    socklen_t len = sizeof soError;
    if (::getsockopt(channel_->fd(), SOL_SOCKET, SO_ERROR, &soError, &len) < 0) {
        soError = errno;
    }
    if (IsPeerGone(soError)) {
        LOG_DEBUG << "conn " << name_ << " SO_ERROR=" << soError;
    } else {
        LOG_ERROR << "conn " << name_ << " SO_ERROR=" << soError;
    }
}

void TcpConnection::QueueWriteComplete() {
    if (!onWriteComplete_) {
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    loop_->QueueInLoop([self]() {
        if (self->onWriteComplete_) self->onWriteComplete_(self);
    });
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) {
        return;
    }
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
        return;
    }
    std::string copy(static_cast<const char*>(data), len);
    loop_->RunInLoop([self = shared_from_this(), copy = std::move(copy)]() {
        self->SendInLoop(copy.data(), copy.size());
    });
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "conn " << name_ << " dropped " << len << " bytes after close";
        return;
    }

    const char* p = static_cast<const char*>(data);
    size_t left = len;

    // Write straight through when nothing is queued ahead and the
    // transport is ready for application data.
    const bool idle = !channel_->IsWriting() && output_.ReadableBytes() == 0;
    if (idle && (!tls_ || tls_->established()) && tlsCtx_ == nullptr) {
        int err = 0;
        const ssize_t n = Transmit(p, left, &err);
        if (n < 0) {
            LOG_DEBUG << "conn " << name_ << " send failed errno=" << err;
            TcpConnectionPtr self(shared_from_this());
            loop_->QueueInLoop([self]() { self->HandleClose(); });
            return;
        }
        if (n > 0) {
            Touch();
            p += n;
            left -= static_cast<size_t>(n);
        }
        if (left == 0) {
            QueueWriteComplete();
            return;
        }
    }

    output_.Append(p, left);
    // Replies queued before the first inbound byte wait for DetectTransport.
    if (tlsCtx_ == nullptr && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

void TcpConnection::Shutdown() {
    State expected = kConnected;
    if (state_.compare_exchange_strong(expected, kDisconnecting)) {
        TcpConnectionPtr self(shared_from_this());
        loop_->RunInLoop([self]() { self->ShutdownInLoop(); });
    }
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting()) {
        return;
    }
    if (tls_) {
        tls_->Close();
    }
    socket_->ShutdownWrite();
}

void TcpConnection::ForceClose() {
    if (state_ == kDisconnected) {
        return;
    }
    TcpConnectionPtr self(shared_from_this());
    loop_->RunInLoop([self]() { self->HandleClose(); });
}

void TcpConnection::StartRead() {
    TcpConnectionPtr self(shared_from_this());
    loop_->RunInLoop([self]() { self->SetReading(true); });
}

void TcpConnection::StopRead() {
    TcpConnectionPtr self(shared_from_this());
    loop_->RunInLoop([self]() { self->SetReading(false); });
}

void TcpConnection::SetReading(bool on) {
    if (reading_ == on || state_ == kDisconnected) {
        return;
    }
    reading_ = on;
    if (on) {
        channel_->EnableReading();
    } else {
        channel_->DisableReading();
    }
}

void TcpConnection::Touch() {
    lastActive_.store(std::chrono::steady_clock::now().time_since_epoch().count(),
                      std::memory_order_relaxed);
}

} // namespace network
} // namespace mediagate
