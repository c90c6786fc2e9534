#include "mediagate/backend/OriginSession.h"
#include "mediagate/protocol/HttpResponseContext.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/Timer.h"
#include "mediagate/common/Logger.h"
#include "mediagate/common/Version.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace mediagate {
namespace backend {

namespace {

bool ParseSize(const std::string& s, uint64_t* out) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    errno = 0;
    const unsigned long long v = std::strtoull(s.c_str(), nullptr, 10);
    if (errno != 0) return false;
    *out = static_cast<uint64_t>(v);
    return true;
}

// filename="a b.mp4" or filename=a.mp4
std::string DispositionFilename(const std::string& value) {
    const std::string lower = protocol::ToLowerCopy(value);
    size_t pos = lower.find("filename=");
    if (pos == std::string::npos) return std::string();
    pos += 9;
    if (pos < value.size() && value[pos] == '"') {
        const size_t end = value.find('"', pos + 1);
        if (end == std::string::npos) return std::string();
        return value.substr(pos + 1, end - pos - 1);
    }
    size_t end = value.find(';', pos);
    if (end == std::string::npos) end = value.size();
    std::string name = value.substr(pos, end - pos);
    while (!name.empty() && std::isspace(static_cast<unsigned char>(name.back()))) name.pop_back();
    return name;
}

// One request/response on a leased origin connection, with a deadline.
// A reused keep-alive connection that closes before answering is retried once
// on a fresh connection.
class OriginExchange : public std::enable_shared_from_this<OriginExchange> {
public:
    using Completion = std::function<void(TransportError, protocol::HttpResponseContext&)>;
    // Runs once the head is parsed; false abandons the body and the connection.
    using HeadCheck = std::function<bool(const protocol::HttpResponseContext&)>;

    OriginExchange(network::EventLoop* loop,
                   BackendConnectionPool* pool,
                   std::string request,
                   bool headRequest,
                   int timeoutMs,
                   Completion done,
                   size_t bodyLimit = 0,
                   HeadCheck headCheck = HeadCheck())
        : loop_(loop),
          pool_(pool),
          request_(std::move(request)),
          headRequest_(headRequest),
          timeoutMs_(timeoutMs),
          bodyLimit_(bodyLimit),
          done_(std::move(done)),
          headCheck_(std::move(headCheck)) {
        PrepareResponse();
    }

    void Start() {
        auto self = shared_from_this();
        timer_ = loop_->RunAfter(timeoutMs_, [self]() {
            LOG_WARN << "Origin " << self->pool_->backendAddress().toIpPort() << " timed out after "
                     << self->timeoutMs_ << " ms";
            self->Complete(TransportError::kTimeout);
        });
        Attempt();
    }

private:
    void PrepareResponse() {
        response_.reset();
        response_.setExpectNoBody(headRequest_);
        response_.setBodyLimit(bodyLimit_);
    }

    void Attempt() {
        auto self = shared_from_this();
        pool_->Acquire(loop_, [self](std::shared_ptr<BackendConnectionPool::Lease> lease) {
            self->OnLease(std::move(lease));
        });
    }

    void OnLease(std::shared_ptr<BackendConnectionPool::Lease> lease) {
        if (finished_) {
            if (lease) lease->Release(true);
            return;
        }
        network::TcpConnectionPtr conn = lease ? lease->connection() : network::TcpConnectionPtr();
        if (!conn || !conn->connected()) {
            Complete(TransportError::kConnectFailed);
            return;
        }
        lease_ = std::move(lease);

        std::weak_ptr<OriginExchange> weak(shared_from_this());
        conn->SetMessageCallback([weak](const network::TcpConnectionPtr&, network::Buffer* buf,
                                        std::chrono::system_clock::time_point) {
            auto self = weak.lock();
            if (!self) {
                buf->RetrieveAll();
                return;
            }
            self->OnMessage(buf);
        });
        conn->SetConnectionCallback([weak](const network::TcpConnectionPtr& c) {
            if (c->connected()) return;
            if (auto self = weak.lock()) self->OnClosed();
        });
        conn->Send(request_);
    }

    void OnMessage(network::Buffer* buf) {
        if (finished_) {
            buf->RetrieveAll();
            return;
        }
        response_.feed(buf->Peek(), buf->ReadableBytes());
        buf->RetrieveAll();
        if (response_.hasError()) {
            Complete(TransportError::kBadResponse);
        } else if (headCheck_ && response_.headComplete() && !headChecked_) {
            headChecked_ = true;
            if (!headCheck_(response_)) {
                Complete(TransportError::kBadResponse);
            } else if (response_.gotAll()) {
                Complete(TransportError::kNone);
            }
        } else if (response_.gotAll()) {
            Complete(TransportError::kNone);
        }
    }

    void OnClosed() {
        if (finished_) return;
        if (response_.finishOnClose()) {
            Complete(TransportError::kNone);
            return;
        }
        if (!response_.started() && lease_ && lease_->reused() && !retried_) {
            LOG_DEBUG << "Idle origin connection was closed under us, retrying on a new one";
            retried_ = true;
            lease_->Release(false);
            lease_.reset();
            PrepareResponse();
            Attempt();
            return;
        }
        Complete(TransportError::kConnectionClosed);
    }

    void Complete(TransportError err) {
        if (finished_) return;
        finished_ = true;
        if (timer_) timer_->Cancel();
        if (lease_) {
            const bool reusable = err == TransportError::kNone && response_.gotAll() &&
                                  !response_.bodyTruncated() && response_.keepAlive() &&
                                  !response_.needsCloseToFinish();
            lease_->Release(reusable);
            lease_.reset();
        }
        Completion done = std::move(done_);
        done_ = nullptr;
        if (done) done(err, response_);
    }

    network::EventLoop* loop_;
    BackendConnectionPool* pool_;
    const std::string request_;
    const bool headRequest_;
    const int timeoutMs_;
    const size_t bodyLimit_;
    Completion done_;
    HeadCheck headCheck_;

    std::shared_ptr<network::Timer> timer_;
    std::shared_ptr<BackendConnectionPool::Lease> lease_;
    protocol::HttpResponseContext response_;
    bool retried_{false};
    bool headChecked_{false};
    bool finished_{false};
};

} // namespace

OriginSession::OriginSession(const Backend& backend, Options options)
    : backend_(backend), options_(std::move(options)) {
    if (!network::InetAddress::Resolve(backend_.host, backend_.port, &address_)) {
        throw BackendUnavailable("cannot resolve backend " + backend_.name + " host " + backend_.host);
    }
    BackendConnectionPool::Config cfg;
    cfg.maxIdlePerLoop = options_.maxIdlePerLoop;
    pool_.reset(new BackendConnectionPool(address_, cfg));
    LOG_INFO << "OriginSession for " << backend_.name << " at " << address_.toIpPort();
}

OriginSession::~OriginSession() = default;

std::string OriginSession::RequestPath(const std::string& objectId) const {
    std::string path = options_.pathPrefix;
    if (path.empty() || path.back() != '/') path.push_back('/');
    if (path.front() != '/') path.insert(path.begin(), '/');
    return path + objectId;
}

std::string OriginSession::BuildRequest(const char* method,
                                        const std::string& objectId,
                                        const std::string& extraHeaders) const {
    std::string req;
    req.reserve(256);
    req += method;
    req += ' ';
    req += RequestPath(objectId);
    req += " HTTP/1.1\r\nHost: ";
    req += backend_.host;
    req += ':';
    req += std::to_string(backend_.port);
    req += "\r\nUser-Agent: mediagate/" MEDIAGATE_VERSION "\r\nAccept: */*\r\n";
    req += extraHeaders;
    req += "\r\n";
    return req;
}

void OriginSession::Stat(network::EventLoop* loop, const std::string& objectId, StatCallback cb) {
    const std::string id = objectId;
    auto self = shared_from_this();
    auto exchange = std::make_shared<OriginExchange>(
        loop, pool_.get(), BuildRequest("HEAD", objectId, ""), true, options_.timeoutMs,
        [self, id, cb](TransportError err, protocol::HttpResponseContext& resp) {
            StatResult result;
            if (err != TransportError::kNone) {
                result.error = err;
            } else if (resp.statusCode() == 404) {
                result.error = TransportError::kNotFound;
            } else if (resp.statusCode() != 200 || !ParseSize(resp.getHeader("Content-Length"), &result.stat.size)) {
                LOG_WARN << "Origin " << self->backend_.name << " stat of " << id << " answered "
                         << resp.statusCode() << " without a usable Content-Length";
                result.error = TransportError::kBadResponse;
            } else {
                result.stat.contentType = resp.getHeader("Content-Type");
                result.stat.name = resp.getHeader("X-Object-Name");
                if (result.stat.name.empty()) {
                    result.stat.name = DispositionFilename(resp.getHeader("Content-Disposition"));
                }
                if (result.stat.name.empty()) result.stat.name = id;
            }
            cb(result);
        });
    exchange->Start();
}

void OriginSession::FetchChunk(network::EventLoop* loop,
                               const std::string& objectId,
                               uint64_t offset,
                               uint64_t length,
                               ChunkCallback cb) {
    if (length == 0) {
        loop->QueueInLoop([cb]() { cb(TransportError::kNone, std::string()); });
        return;
    }
    const std::string range = "Range: bytes=" + std::to_string(offset) + "-" +
                              std::to_string(offset + length - 1) + "\r\n";
    const std::string expectedStart = "bytes " + std::to_string(offset) + "-";
    auto self = shared_from_this();
    // Only a 206 at the right offset, or a whole-object 200 for the first chunk,
    // is worth reading; anything else is dropped before its body arrives.
    auto headCheck = [self, offset, expectedStart](const protocol::HttpResponseContext& resp) {
        const int status = resp.statusCode();
        if (status == 404) return true;
        if (status == 206) {
            if (resp.getHeader("Content-Range").compare(0, expectedStart.size(), expectedStart) == 0) return true;
            LOG_WARN << "Origin " << self->backend_.name << " sent Content-Range "
                     << resp.getHeader("Content-Range") << " for offset " << offset;
            return false;
        }
        // An origin that ignores Range is usable only for the first chunk.
        if (status == 200 && offset == 0) return true;
        LOG_WARN << "Origin " << self->backend_.name << " answered " << status << " to a range fetch";
        return false;
    };
    auto exchange = std::make_shared<OriginExchange>(
        loop, pool_.get(), BuildRequest("GET", objectId, range), false, options_.timeoutMs,
        [cb](TransportError err, protocol::HttpResponseContext& resp) {
            if (err != TransportError::kNone) {
                cb(err, std::string());
            } else if (resp.statusCode() == 404) {
                cb(TransportError::kNotFound, std::string());
            } else {
                cb(TransportError::kNone, resp.takeBody());
            }
        },
        static_cast<size_t>(length), headCheck);
    exchange->Start();
}

} // namespace backend
} // namespace mediagate
