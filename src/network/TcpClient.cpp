#include "mediagate/network/TcpClient.h"
#include "mediagate/network/Connector.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include <utility>

namespace mediagate {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name)
    : loop_(loop),
      name_(std::move(name)),
      connector_(std::make_shared<Connector>(loop, serverAddr)) {
    connector_->SetResultCallback([this](int sockfd, int err) { OnConnectResult(sockfd, err); });
}

TcpClient::~TcpClient() {
    TcpConnectionPtr conn = connection();
    if (!conn) {
        connector_->Stop();
        return;
    }
    // The connection can outlive this client; detach it before closing.
    EventLoop* loop = loop_;
    loop_->RunInLoop([conn, loop]() {
        conn->SetConnectionCallback(ConnectionCallback());
        conn->SetMessageCallback(MessageCallback());
        conn->SetWriteCompleteCallback(WriteCompleteCallback());
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
            loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
        });
    });
    conn->ForceClose();
}

void TcpClient::Connect() {
    ++attempts_;
    LOG_DEBUG << name_ << ": connecting to " << connector_->serverAddress().toIpPort()
              << " (attempt " << attempts_ << ")";
    connector_->Start();
}

void TcpClient::Disconnect() {
    TcpConnectionPtr conn = connection();
    if (conn) {
        conn->Shutdown();
    }
}

void TcpClient::OnConnectResult(int sockfd, int err) {
    if (sockfd < 0) {
        if (onConnectFailed_) onConnectFailed_(err);
        return;
    }

    const InetAddress& peer = connector_->serverAddress();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        loop_, name_ + "#" + std::to_string(attempts_) + "@" + peer.toIpPort(), sockfd, peer);
    conn->SetConnectionCallback(onConnection_);
    conn->SetMessageCallback(onMessage_);
    conn->SetWriteCompleteCallback(onWriteComplete_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::RemoveConnection(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_.reset();
    }
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace mediagate
