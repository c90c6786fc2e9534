#pragma once

#include "mediagate/network/TcpServer.h"
#include "mediagate/common/noncopyable.h"

#include <functional>
#include <memory>
#include <string>

namespace mediagate {
namespace protocol {

class HttpRequest;
class ResponseWriter;
struct ConnectionState;

// HTTP/1.1 server with asynchronous handlers. A handler answers through the
// writer, now or later; until the writer finishes, pipelined requests wait
// in the connection's input buffer.
class HttpServer : mediagate::common::noncopyable {
public:
    // `request` is only valid during the call.
    using HttpCallback = std::function<void(const HttpRequest& request,
                                            const std::shared_ptr<ResponseWriter>& writer)>;

    // Reading pauses once this much unparsed input queues behind a busy request.
    static constexpr size_t kMaxPendingInput = 64 * 1024;

    HttpServer(network::EventLoop* loop,
               const network::InetAddress& listenAddr,
               const std::string& name,
               bool reusePort = false);

    network::EventLoop* getLoop() const { return server_.getLoop(); }
    network::TcpServer& tcpServer() { return server_; }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }
    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }

    void start();

private:
    void onConnection(const network::TcpConnectionPtr& conn);
    void onMessage(const network::TcpConnectionPtr& conn,
                   network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onWriteComplete(const network::TcpConnectionPtr& conn);
    void processBuffer(const network::TcpConnectionPtr& conn, std::chrono::system_clock::time_point receiveTime);
    void onRequest(const network::TcpConnectionPtr& conn, ConnectionState* state, const HttpRequest& req);
    void onDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepAlive);

    HttpCallback httpCallback_;
    // Last member: connections go away before the callback they use.
    network::TcpServer server_;
};

} // namespace protocol
} // namespace mediagate
