#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/TcpConnection.h"

#include <functional>
#include <mutex>

namespace mediagate {
namespace network {

class Connector;
class EventLoop;

// A single outbound connection bound to one loop. Apart from connection(),
// which any thread may call, use it from that loop only.
class TcpClient : mediagate::common::noncopyable {
public:
    using ConnectFailedCallback = std::function<void(int err)>;

    TcpClient(EventLoop* loop, const InetAddress& serverAddr, std::string name);
    // Closes the live connection, if any, without calling back into this client.
    ~TcpClient();

    void Connect();
    void Disconnect();

    TcpConnectionPtr connection() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connection_;
    }

    const std::string& name() const { return name_; }

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { onWriteComplete_ = std::move(cb); }
    void SetConnectFailedCallback(ConnectFailedCallback cb) { onConnectFailed_ = std::move(cb); }

private:
    void OnConnectResult(int sockfd, int err);
    void RemoveConnection(const TcpConnectionPtr& conn);

    EventLoop* const loop_;
    const std::string name_;
    std::shared_ptr<Connector> connector_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;
    WriteCompleteCallback onWriteComplete_;
    ConnectFailedCallback onConnectFailed_;

    unsigned attempts_ = 0;
    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace mediagate
