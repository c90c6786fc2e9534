#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/Buffer.h"
#include "mediagate/network/Callbacks.h"
#include "mediagate/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

struct ssl_ctx_st;

namespace mediagate {
namespace network {

class Channel;
class EventLoop;
class Socket;
class TlsStream;

// One established TCP connection, owned through shared_ptr by its server
// or client and driven by a single loop. Send, Shutdown, ForceClose and the
// read toggles may be called from any thread.
class TcpConnection : mediagate::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    // With a TLS context the first inbound byte decides between TLS and plaintext.
    TcpConnection(EventLoop* loop,
                  std::string name,
                  int sockfd,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* tlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool secure() const { return tls_ != nullptr; }

    // Per-connection protocol state, owned by whoever installs it.
    void SetContext(std::any context) { context_ = std::move(context); }
    std::any* GetMutableContext() { return &context_; }

    // Loop thread only.
    Buffer* inputBuffer() { return &input_; }
    size_t pendingOutputBytes() const { return output_.ReadableBytes(); }

    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-closes once everything queued has been written.
    void Shutdown();
    void ForceClose();
    void StartRead();
    void StopRead();

    std::chrono::steady_clock::time_point LastActiveTime() const {
        return std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(lastActive_.load(std::memory_order_relaxed)));
    }

    void SetConnectionCallback(ConnectionCallback cb) { onConnection_ = std::move(cb); }
    void SetMessageCallback(MessageCallback cb) { onMessage_ = std::move(cb); }
    void SetWriteCompleteCallback(WriteCompleteCallback cb) { onWriteComplete_ = std::move(cb); }
    void SetCloseCallback(CloseCallback cb) { onClose_ = std::move(cb); }

    // Owner hooks: first and last calls made on the loop for this connection.
    void ConnectEstablished();
    void ConnectDestroyed();

private:
    enum State { kConnecting, kConnected, kDisconnecting, kDisconnected };

    static const char* StateName(State s);

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    // Transport layer: plaintext socket calls or the TLS session.
    bool DetectTransport();
    bool AdvanceHandshake();
    ssize_t ReadInput(int* err);
    ssize_t Transmit(const void* data, size_t len, int* err);

    void SendInLoop(const void* data, size_t len);
    void ShutdownInLoop();
    void QueueWriteComplete();
    void SetReading(bool on);
    void Touch();

    EventLoop* const loop_;
    const std::string name_;
    std::atomic<State> state_{kConnecting};
    bool reading_ = true;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;
    const InetAddress peerAddr_;

    // Cleared once the transport is known.
    ssl_ctx_st* tlsCtx_;
    std::unique_ptr<TlsStream> tls_;

    ConnectionCallback onConnection_;
    MessageCallback onMessage_;
    WriteCompleteCallback onWriteComplete_;
    CloseCallback onClose_;

    Buffer input_;
    Buffer output_;
    std::any context_;
    std::atomic<std::chrono::steady_clock::rep> lastActive_{0};
};

} // namespace network
} // namespace mediagate
