#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/Callbacks.h"

#include <functional>
#include <memory>
#include <string>

namespace mediagate {
namespace network {
class EventLoop;
}

namespace protocol {

class HttpResponse;

// Handle for producing one response, possibly long after the handler returned.
// Lives on the connection's loop; every method must be called there.
class ResponseWriter : mediagate::common::noncopyable {
public:
    using DrainCallback = std::function<void()>;
    using AbortCallback = std::function<void()>;
    using DoneCallback = std::function<void(bool keepAlive)>;

    ResponseWriter(const network::TcpConnectionPtr& conn, bool closeAfter, bool headRequest);

    network::EventLoop* getLoop() const { return loop_; }
    bool headRequest() const { return headRequest_; }
    bool closeAfter() const { return closeAfter_; }
    bool finished() const { return finished_; }
    bool headSent() const { return headSent_; }
    bool connected() const;
    // Client IP as seen on the socket.
    const std::string& peerIp() const { return peerIp_; }

    // Whole response, then Finish(). HEAD requests get the header block only.
    void Send(HttpResponse& response);

    // Header block of a streamed response. Content-Length must already be set.
    void SendHead(HttpResponse& response);

    // One body piece. `onDrained` runs once the socket has taken every queued byte.
    void SendBody(const std::string& data, DrainCallback onDrained);

    // Response complete; the connection goes back to reading requests (or closes).
    void Finish();

    // The promised response cannot be completed: drop the connection.
    void Abort();

    // Runs at most once if the client goes away before Finish()/Abort().
    void SetAbortCallback(AbortCallback cb) { abortCallback_ = std::move(cb); }

    // HttpServer side.
    void SetDoneCallback(DoneCallback cb) { doneCallback_ = std::move(cb); }
    void OnWriteComplete();
    void OnConnectionClosed();

private:
    std::weak_ptr<network::TcpConnection> conn_;
    network::EventLoop* loop_;
    const std::string peerIp_;
    const bool closeAfter_;
    const bool headRequest_;
    bool headSent_{false};
    bool finished_{false};

    DrainCallback drainCallback_;
    AbortCallback abortCallback_;
    DoneCallback doneCallback_;
};

} // namespace protocol
} // namespace mediagate
