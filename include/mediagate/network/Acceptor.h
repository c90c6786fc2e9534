#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/Channel.h"
#include "mediagate/network/Socket.h"

#include <functional>
#include <utility>

namespace mediagate {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket of a TcpServer. Each readable event drains the accept
// queue (bounded per wakeup) and hands every new fd to the callback.
class Acceptor : mediagate::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    // Binds immediately; throws std::system_error when the address is taken.
    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { onNewConnection_ = std::move(cb); }

    bool listening() const { return listening_; }
    void Listen();

private:
    static const int kBacklog = 1024;
    static const int kMaxAcceptsPerEvent = 64;

    void HandleRead();
    void ShedOneConnection();

    Socket socket_;
    Channel channel_;
    NewConnectionCallback onNewConnection_;
    bool listening_ = false;
    // Spare descriptor released when the process hits EMFILE.
    int idleFd_;
};

} // namespace network
} // namespace mediagate
