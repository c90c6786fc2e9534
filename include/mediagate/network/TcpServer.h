#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/Callbacks.h"
#include "mediagate/network/EventLoopThreadPool.h"
#include "mediagate/network/InetAddress.h"
#include "mediagate/network/TcpConnection.h"
#include "mediagate/network/TlsContext.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>

namespace mediagate {
namespace network {

class Acceptor;
class EventLoop;
class Timer;

// Accepts on the base loop and hands each connection to an I/O loop.
// Apart from Start(), every method is for the base loop thread.
class TcpServer : mediagate::common::noncopyable {
public:
    // Admission and idle policy; zero disables a limit.
    struct Limits {
        int maxConnections = 0;
        int maxConnectionsPerIp = 0;
        double idleTimeoutSec = 0.0;
    };

    // Binds at once; throws std::system_error if the address is unavailable.
    TcpServer(EventLoop* loop, const InetAddress& listenAddr, std::string name, bool reusePort = false);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }
    size_t connectionCount() const { return connections_.size(); }

    void SetThreadNum(int numThreads) { ioLoops_.SetThreadNum(numThreads); }
    void SetLimits(const Limits& limits) { limits_ = limits; }

    // Plain HTTP and HTTPS then share the listener; each connection's
    // first byte picks the transport.
    bool EnableTls(const std::string& certChainPath, const std::string& keyPath);

    void Start();

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { onWriteComplete_ = std::move(cb); }

private:
    static const int kSweepIntervalMs = 1000;

    void NewConnection(int sockfd, const InetAddress& peerAddr);
    bool Admit(const InetAddress& peerAddr) const;
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void ScheduleIdleSweep();
    void SweepIdleConnections();

    EventLoop* const loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    EventLoopThreadPool ioLoops_;
    std::shared_ptr<TlsContext> tls_;
    Limits limits_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;
    WriteCompleteCallback onWriteComplete_;

    std::atomic<bool> started_{false};
    uint64_t nextConnId_ = 1;
    std::map<std::string, TcpConnectionPtr> connections_;
    std::unordered_map<std::string, int> perIpCounts_;
    std::shared_ptr<Timer> sweepTimer_;
};

} // namespace network
} // namespace mediagate
