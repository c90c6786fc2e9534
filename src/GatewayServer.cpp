#include "mediagate/GatewayServer.h"
#include "mediagate/StatusReport.h"
#include "mediagate/backend/OriginSession.h"
#include "mediagate/protocol/HttpRequest.h"
#include "mediagate/protocol/HttpResponse.h"
#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/stream/ChunkSequencer.h"
#include "mediagate/stream/MediaStream.h"
#include "mediagate/common/Logger.h"
#include "mediagate/common/Version.h"

#include <exception>

namespace mediagate {

using protocol::HttpRequest;
using protocol::HttpResponse;
using protocol::ResponseWriter;

namespace {

GatewayServer::SessionFactory OriginSessionFactory(const GatewayOptions& options) {
    const std::vector<backend::Backend> backends = options.backends;
    backend::OriginSession::Options sessionOptions;
    sessionOptions.pathPrefix = options.originPrefix;
    sessionOptions.timeoutMs = options.fetchTimeoutMs;
    sessionOptions.maxIdlePerLoop = options.maxIdlePerBackend;
    return [backends, sessionOptions](backend::BackendId id) -> std::shared_ptr<backend::ContentSource> {
        return std::make_shared<backend::OriginSession>(backends.at(id), sessionOptions);
    };
}

struct Route {
    const char* prefix;
    stream::Disposition disposition;
    bool frameable;
};

const Route kMediaRoutes[] = {
    {"/dl/", stream::Disposition::kAttachment, false},
    {"/video/", stream::Disposition::kInline, true},
    {"/stream/", stream::Disposition::kInline, true},
};

bool IsReadMethod(HttpRequest::Method m) {
    return m == HttpRequest::kGet || m == HttpRequest::kHead;
}

} // namespace

GatewayServer::GatewayServer(network::EventLoop* loop, const GatewayOptions& options)
    : GatewayServer(loop, options, OriginSessionFactory(options)) {
}

GatewayServer::GatewayServer(network::EventLoop* loop,
                             const GatewayOptions& options,
                             SessionFactory factory,
                             std::shared_ptr<stream::ObjectResolver> resolver)
    : startTime_(std::chrono::steady_clock::now()),
      options_(options),
      pool_(options.backends, options.loadAccounting),
      sessions_(options.backends.size(), std::move(factory)),
      resolver_(std::move(resolver)),
      planner_(options.chunkSize),
      server_(loop, network::InetAddress(options.bindAddress, options.port), options.name, options.reusePort) {
    if (!resolver_) {
        resolver_ = std::make_shared<stream::TokenResolver>(
            stream::TokenCodec(options_.tokenSecret, options_.verifyTokens));
    }
    server_.setHttpCallback([this](const HttpRequest& req, const std::shared_ptr<ResponseWriter>& writer) {
        OnRequest(req, writer);
    });
}

bool GatewayServer::Start() {
    network::TcpServer& tcp = server_.tcpServer();
    if (options_.tlsEnable) {
        if (!tcp.EnableTls(options_.certPath, options_.keyPath)) {
            LOG_ERROR << "TLS setup failed for cert " << options_.certPath;
            return false;
        }
        LOG_INFO << "TLS termination enabled";
    }
    network::TcpServer::Limits limits;
    limits.maxConnections = options_.maxConnections;
    limits.maxConnectionsPerIp = options_.maxConnectionsPerIp;
    limits.idleTimeoutSec = options_.idleTimeoutSec;
    tcp.SetLimits(limits);
    server_.setThreadNum(options_.threads);
    LOG_INFO << "mediagate " << MEDIAGATE_VERSION << " as @" << options_.name << ", " << pool_.size()
             << " backend(s), chunk size " << planner_.chunkSize();
    server_.start();
    return true;
}

std::string GatewayServer::StatusJson() const {
    StatusSnapshot snapshot;
    snapshot.uptimeSeconds = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime_).count());
    snapshot.name = options_.name;
    snapshot.connectedBackends = pool_.size();
    snapshot.loads = pool_.Loads();
    snapshot.version = MEDIAGATE_VERSION;
    return mediagate::StatusJson(snapshot);
}

std::string GatewayServer::ClientAddress(const HttpRequest& req, const ResponseWriter& writer) {
    std::string forwarded = req.getHeader("X-Forwarded-For");
    const size_t comma = forwarded.find(',');
    if (comma != std::string::npos) forwarded.resize(comma);
    while (!forwarded.empty() && forwarded.back() == ' ') forwarded.pop_back();
    return forwarded.empty() ? writer.peerIp() : forwarded;
}

void GatewayServer::OnRequest(const HttpRequest& req, const std::shared_ptr<ResponseWriter>& writer) {
    try {
        const std::string& path = req.path();
        if (path == "/status" || path == "/") {
            if (!IsReadMethod(req.getMethod())) {
                SendError(writer, HttpResponse::k405MethodNotAllowed, "Method Not Allowed");
                return;
            }
            HandleStatus(writer);
            return;
        }

        for (const Route& route : kMediaRoutes) {
            const std::string prefix(route.prefix);
            if (path.compare(0, prefix.size(), prefix) != 0) continue;
            const std::string token = path.substr(prefix.size());
            if (token.empty() || token.find('/') != std::string::npos) break;

            if (req.getMethod() == HttpRequest::kOptions) {
                HttpResponse response(writer->closeAfter());
                stream::ResponseAssembler::BuildPreflight(&response);
                writer->Send(response);
            } else if (IsReadMethod(req.getMethod())) {
                HandleMedia(req, writer, token, route.disposition, route.frameable);
            } else {
                SendError(writer, HttpResponse::k405MethodNotAllowed, "Method Not Allowed");
            }
            return;
        }

        SendError(writer, HttpResponse::k404NotFound, "Not Found");
    } catch (const std::exception& e) {
        LOG_ERROR << "Request " << req.methodString() << " " << req.path() << " failed: " << e.what();
        FailRequest(writer);
    }
}

void GatewayServer::HandleStatus(const std::shared_ptr<ResponseWriter>& writer) {
    HttpResponse response(writer->closeAfter());
    response.setStatusCode(HttpResponse::k200Ok);
    response.setContentType("application/json");
    response.setBody(StatusJson());
    writer->Send(response);
}

void GatewayServer::SendError(const std::shared_ptr<ResponseWriter>& writer,
                              HttpResponse::HttpStatusCode code,
                              const std::string& message) {
    HttpResponse response(writer->closeAfter());
    stream::ResponseAssembler::BuildError(code, message, &response);
    if (code == HttpResponse::k405MethodNotAllowed) response.addHeader("Allow", "GET, HEAD, OPTIONS");
    writer->Send(response);
}

void GatewayServer::HandleMedia(const HttpRequest& req,
                                const std::shared_ptr<ResponseWriter>& writer,
                                const std::string& token,
                                stream::Disposition disposition,
                                bool frameable) {
    const backend::BackendId id = pool_.Select();
    auto load = std::make_shared<backend::BackendPool::LoadGuard>(pool_.Acquire(id));
    LOG_INFO << "Backend " << id << " (" << pool_.backend(id).name << ") serving "
             << ClientAddress(req, *writer) << " " << req.methodString() << " " << req.path();

    std::shared_ptr<backend::ContentSource> session;
    try {
        session = sessions_.GetOrCreate(id);
    } catch (const std::exception& e) {
        LOG_ERROR << "No session for backend " << id << ": " << e.what();
    }
    if (!session) {
        SendError(writer, HttpResponse::k500InternalServerError, "Backend Unavailable");
        return;
    }

    const std::string rangeHeader = req.getHeader("Range");
    const std::string target = std::string(req.methodString()) + " " + req.path();
    resolver_->Resolve(writer->getLoop(), token, session,
                       [this, writer, load, session, rangeHeader, target, disposition, frameable](
                           const stream::ResolveResult& result) {
        // Runs later on the loop, outside OnRequest.
        try {
            OnResolved(result, writer, load, session, rangeHeader, disposition, frameable);
        } catch (const std::exception& e) {
            LOG_ERROR << "Request " << target << " failed: " << e.what();
            FailRequest(writer);
        }
    });
}

void GatewayServer::OnResolved(const stream::ResolveResult& result,
                               const std::shared_ptr<ResponseWriter>& writer,
                               const std::shared_ptr<backend::BackendPool::LoadGuard>& load,
                               const std::shared_ptr<backend::ContentSource>& session,
                               const std::string& rangeHeader,
                               stream::Disposition disposition,
                               bool frameable) {
    if (writer->finished()) return;
    switch (result.status) {
        case stream::ResolveStatus::kOk:
            break;
        case stream::ResolveStatus::kInvalidHandle:
            SendError(writer, HttpResponse::k403Forbidden, "Forbidden");
            return;
        case stream::ResolveStatus::kObjectNotFound:
            SendError(writer, HttpResponse::k404NotFound, "Not Found");
            return;
        case stream::ResolveStatus::kBackendFailure:
            SendError(writer, HttpResponse::k500InternalServerError, "Internal Server Error");
            return;
    }

    const stream::ObjectMetadata& meta = result.metadata;
    stream::RangeSpec range;
    if (planner_.Parse(rangeHeader, meta.size, &range) != stream::RangeStatus::kOk) {
        LOG_DEBUG << "Range \"" << rangeHeader << "\" not satisfiable for size " << meta.size;
        HttpResponse response(writer->closeAfter());
        stream::ResponseAssembler::BuildNotSatisfiable(meta.size, &response);
        writer->Send(response);
        return;
    }

    HttpResponse response(writer->closeAfter());
    stream::ResponseAssembler::BuildMediaHead(meta, range, disposition, &response);
    if (frameable) response.addHeader("X-Frame-Options", "ALLOWALL");

    if (writer->headRequest() || range.length == 0) {
        writer->Send(response);
        return;
    }

    auto sequencer = std::make_shared<stream::ChunkSequencer>(
        writer->getLoop(), session, meta.objectId, planner_.Plan(range));
    writer->SendHead(response);
    auto media = std::make_shared<stream::MediaStream>(sequencer, writer, load);
    media->Start();
}

void GatewayServer::FailRequest(const std::shared_ptr<ResponseWriter>& writer) {
    if (writer->finished()) return;
    if (writer->headSent()) {
        writer->Abort();
    } else {
        SendError(writer, HttpResponse::k500InternalServerError, "Internal Server Error");
    }
}

} // namespace mediagate
