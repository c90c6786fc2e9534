#include "mediagate/network/TcpServer.h"
#include "mediagate/network/Acceptor.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/Timer.h"
#include "mediagate/common/Logger.h"

#include <unistd.h>
#include <utility>
#include <vector>

namespace mediagate {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name, bool reusePort)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(std::move(name)),
      acceptor_(new Acceptor(loop, listenAddr, reusePort)),
      ioLoops_(loop, name_) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { NewConnection(sockfd, peer); });
}

TcpServer::~TcpServer() {
    if (sweepTimer_) {
        sweepTimer_->Cancel();
    }
    for (auto& entry : connections_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
}

bool TcpServer::EnableTls(const std::string& certChainPath, const std::string& keyPath) {
    tls_ = TlsContext::CreateServer(certChainPath, keyPath);
    return tls_ != nullptr;
}

void TcpServer::Start() {
    if (started_.exchange(true)) {
        return;
    }
    ioLoops_.Start();
    loop_->RunInLoop([this]() {
        acceptor_->Listen();
        if (limits_.idleTimeoutSec > 0.0) {
            ScheduleIdleSweep();
        }
    });
}

void TcpServer::ScheduleIdleSweep() {
    sweepTimer_ = loop_->RunAfter(kSweepIntervalMs, [this]() {
        SweepIdleConnections();
        ScheduleIdleSweep();
    });
}

void TcpServer::SweepIdleConnections() {
    const auto deadline = std::chrono::steady_clock::now() -
                          std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                              std::chrono::duration<double>(limits_.idleTimeoutSec));
    std::vector<TcpConnectionPtr> idle;
    for (const auto& entry : connections_) {
        if (entry.second->LastActiveTime() < deadline) {
            idle.push_back(entry.second);
        }
    }
    for (const TcpConnectionPtr& conn : idle) {
        LOG_INFO << name_ << ": closing idle connection from " << conn->peerAddress().toIpPort();
        conn->ForceClose();
    }
}

bool TcpServer::Admit(const InetAddress& peerAddr) const {
    if (limits_.maxConnections > 0 && static_cast<int>(connections_.size()) >= limits_.maxConnections) {
        LOG_WARN << name_ << ": refusing " << peerAddr.toIpPort() << ", " << limits_.maxConnections
                 << " connections open";
        return false;
    }
    if (limits_.maxConnectionsPerIp > 0) {
        auto it = perIpCounts_.find(peerAddr.toIp());
        if (it != perIpCounts_.end() && it->second >= limits_.maxConnectionsPerIp) {
            LOG_WARN << name_ << ": refusing " << peerAddr.toIpPort() << ", per-address limit "
                     << limits_.maxConnectionsPerIp;
            return false;
        }
    }
    return true;
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (!Admit(peerAddr)) {
        ::close(sockfd);
        return;
    }

    std::string connName = name_ + "#" + std::to_string(nextConnId_++) + "@" + peerAddr.toIpPort();
    EventLoop* ioLoop = ioLoops_.GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        ioLoop, connName, sockfd, peerAddr, tls_ ? tls_->ctx() : nullptr);
    LOG_DEBUG << name_ << ": accepted " << connName;

    connections_[connName] = conn;
    ++perIpCounts_[peerAddr.toIp()];
    conn->SetConnectionCallback(onConnection_);
    conn->SetMessageCallback(onMessage_);
    conn->SetWriteCompleteCallback(onWriteComplete_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });
    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

// Runs on the connection's I/O loop; the bookkeeping belongs to the base loop.
void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    if (connections_.erase(conn->name()) == 0) {
        return;
    }
    auto it = perIpCounts_.find(conn->peerAddress().toIp());
    if (it != perIpCounts_.end() && --it->second <= 0) {
        perIpCounts_.erase(it);
    }
    conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace mediagate
