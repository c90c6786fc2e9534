#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/network/TcpConnection.h"
#include "mediagate/common/Logger.h"

namespace mediagate {
namespace protocol {

ResponseWriter::ResponseWriter(const network::TcpConnectionPtr& conn, bool closeAfter, bool headRequest)
    : conn_(conn),
      loop_(conn->getLoop()),
      peerIp_(conn->peerAddress().toIp()),
      closeAfter_(closeAfter),
      headRequest_(headRequest) {}

bool ResponseWriter::connected() const {
    auto conn = conn_.lock();
    return conn && conn->connected();
}

void ResponseWriter::Send(HttpResponse& response) {
    if (finished_) return;
    response.setCloseConnection(closeAfter_);
    auto conn = conn_.lock();
    if (conn) {
        network::Buffer buf;
        if (headRequest_) {
            response.appendHeadToBuffer(&buf);
        } else {
            response.appendToBuffer(&buf);
        }
        conn->Send(buf.RetrieveAllAsString());
    }
    headSent_ = true;
    Finish();
}

void ResponseWriter::SendHead(HttpResponse& response) {
    if (finished_ || headSent_) return;
    response.setCloseConnection(closeAfter_);
    headSent_ = true;
    auto conn = conn_.lock();
    if (!conn) return;
    network::Buffer buf;
    response.appendHeadToBuffer(&buf);
    conn->Send(buf.RetrieveAllAsString());
}

void ResponseWriter::SendBody(const std::string& data, DrainCallback onDrained) {
    if (finished_) return;
    auto conn = conn_.lock();
    if (!conn || !conn->connected()) return;
    drainCallback_ = std::move(onDrained);
    conn->Send(data);
}

void ResponseWriter::OnWriteComplete() {
    if (finished_ || !drainCallback_) return;
    auto conn = conn_.lock();
    if (!conn || conn->pendingOutputBytes() != 0) return;
    DrainCallback cb = std::move(drainCallback_);
    drainCallback_ = nullptr;
    cb();
}

void ResponseWriter::Finish() {
    if (finished_) return;
    finished_ = true;
    drainCallback_ = nullptr;
    abortCallback_ = nullptr;
    DoneCallback done = std::move(doneCallback_);
    doneCallback_ = nullptr;
    if (done) done(!closeAfter_);
}

void ResponseWriter::Abort() {
    if (finished_) return;
    finished_ = true;
    drainCallback_ = nullptr;
    abortCallback_ = nullptr;
    doneCallback_ = nullptr;
    if (auto conn = conn_.lock()) {
        LOG_DEBUG << "Aborting response on " << conn->name();
        conn->ForceClose();
    }
}

void ResponseWriter::OnConnectionClosed() {
    if (finished_) return;
    finished_ = true;
    drainCallback_ = nullptr;
    doneCallback_ = nullptr;
    AbortCallback cb = std::move(abortCallback_);
    abortCallback_ = nullptr;
    LOG_DEBUG << "Client went away before the response completed";
    if (cb) cb();
}

} // namespace protocol
} // namespace mediagate
