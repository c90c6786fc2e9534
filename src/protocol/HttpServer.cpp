#include "mediagate/protocol/HttpServer.h"
#include "mediagate/protocol/HttpContext.h"
#include "mediagate/protocol/HttpRequest.h"
#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/TcpConnection.h"
#include "mediagate/common/Logger.h"

namespace mediagate {
namespace protocol {

// Per-connection parser plus the response currently in progress.
struct ConnectionState {
    HttpContext parser;
    std::shared_ptr<ResponseWriter> writer;
};

HttpServer::HttpServer(network::EventLoop* loop,
                       const network::InetAddress& listenAddr,
                       const std::string& name,
                       bool reusePort)
    : server_(loop, listenAddr, name, reusePort) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
    server_.SetWriteCompleteCallback(
        std::bind(&HttpServer::onWriteComplete, this, std::placeholders::_1));
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::onConnection(const network::TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(ConnectionState());
        return;
    }
    auto* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr) return;
    std::shared_ptr<ResponseWriter> writer = std::move(state->writer);
    state->writer.reset();
    if (writer) writer->OnConnectionClosed();
}

void HttpServer::onMessage(const network::TcpConnectionPtr& conn,
                           network::Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    (void)buf;
    processBuffer(conn, receiveTime);
}

void HttpServer::onWriteComplete(const network::TcpConnectionPtr& conn) {
    auto* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr || !state->writer) return;
    std::shared_ptr<ResponseWriter> writer = state->writer;
    writer->OnWriteComplete();
}

void HttpServer::processBuffer(const network::TcpConnectionPtr& conn,
                               std::chrono::system_clock::time_point receiveTime) {
    auto* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
    if (state == nullptr) return;
    network::Buffer* buf = conn->inputBuffer();

    // Keep-alive / pipelining: one request at a time, the rest stays buffered.
    while (!state->writer && conn->connected()) {
        if (!state->parser.parseRequest(buf, receiveTime)) {
            LOG_DEBUG << "Bad request from " << conn->peerAddress().toIpPort();
            HttpResponse response(true);
            response.setStatusCode(HttpResponse::k400BadRequest);
            network::Buffer out;
            response.appendToBuffer(&out);
            conn->Send(out.RetrieveAllAsString());
            conn->Shutdown();
            return;
        }
        if (!state->parser.gotAll()) break;

        HttpRequest request;
        request.swap(state->parser.request());
        state->parser.reset();
        onRequest(conn, state, request);
    }

    if (state->writer && buf->ReadableBytes() > kMaxPendingInput) {
        conn->StopRead();
    }
}

void HttpServer::onRequest(const network::TcpConnectionPtr& conn, ConnectionState* state, const HttpRequest& req) {
    const bool close = !req.keepAlive();
    auto writer = std::make_shared<ResponseWriter>(conn, close, req.getMethod() == HttpRequest::kHead);
    std::weak_ptr<network::TcpConnection> weakConn(conn);
    writer->SetDoneCallback([this, weakConn](bool keepAlive) { onDone(weakConn, keepAlive); });
    state->writer = writer;

    if (httpCallback_) {
        httpCallback_(req, writer);
    } else {
        HttpResponse response(close);
        response.setStatusCode(HttpResponse::k404NotFound);
        writer->Send(response);
    }
}

void HttpServer::onDone(const std::weak_ptr<network::TcpConnection>& weakConn, bool keepAlive) {
    network::TcpConnectionPtr conn = weakConn.lock();
    if (!conn) return;
    // Deferred so a handler that answers synchronously does not re-enter processBuffer.
    conn->getLoop()->QueueInLoop([this, conn, keepAlive]() {
        auto* state = std::any_cast<ConnectionState>(conn->GetMutableContext());
        if (state == nullptr) return;
        state->writer.reset();
        if (!keepAlive) {
            conn->Shutdown();
            return;
        }
        conn->StartRead();
        processBuffer(conn, std::chrono::system_clock::now());
    });
}

} // namespace protocol
} // namespace mediagate
