#pragma once

#include "mediagate/GatewayOptions.h"
#include "mediagate/backend/BackendPool.h"
#include "mediagate/backend/ContentSource.h"
#include "mediagate/backend/SessionCache.h"
#include "mediagate/common/noncopyable.h"
#include "mediagate/protocol/HttpServer.h"
#include "mediagate/stream/ObjectResolver.h"
#include "mediagate/stream/RangePlanner.h"
#include "mediagate/stream/ResponseAssembler.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mediagate {

namespace protocol {
class HttpRequest;
class ResponseWriter;
}

// Byte-range media gateway: routes requests, picks the least-loaded backend
// and streams the object through that backend's session.
class GatewayServer : mediagate::common::noncopyable {
public:
    using SessionFactory = std::function<std::shared_ptr<backend::ContentSource>(backend::BackendId id)>;

    // Origin sessions over HTTP, tokens per options.
    GatewayServer(network::EventLoop* loop, const GatewayOptions& options);
    // Custom session construction and resolution (a null resolver means tokens per options).
    GatewayServer(network::EventLoop* loop,
                  const GatewayOptions& options,
                  SessionFactory factory,
                  std::shared_ptr<stream::ObjectResolver> resolver = nullptr);

    // Applies TLS and listener limits, then starts listening. False if TLS setup failed.
    bool Start();

    const GatewayOptions& options() const { return options_; }
    backend::BackendPool& pool() { return pool_; }
    backend::SessionCache<backend::ContentSource>& sessions() { return sessions_; }

    std::string StatusJson() const;

private:
    void OnRequest(const protocol::HttpRequest& req, const std::shared_ptr<protocol::ResponseWriter>& writer);
    void HandleStatus(const std::shared_ptr<protocol::ResponseWriter>& writer);
    void HandleMedia(const protocol::HttpRequest& req,
                     const std::shared_ptr<protocol::ResponseWriter>& writer,
                     const std::string& token,
                     stream::Disposition disposition,
                     bool frameable);
    void OnResolved(const stream::ResolveResult& result,
                    const std::shared_ptr<protocol::ResponseWriter>& writer,
                    const std::shared_ptr<backend::BackendPool::LoadGuard>& load,
                    const std::shared_ptr<backend::ContentSource>& session,
                    const std::string& rangeHeader,
                    stream::Disposition disposition,
                    bool frameable);
    // 500 if nothing was sent yet, otherwise the connection is dropped.
    void FailRequest(const std::shared_ptr<protocol::ResponseWriter>& writer);
    void SendError(const std::shared_ptr<protocol::ResponseWriter>& writer,
                   protocol::HttpResponse::HttpStatusCode code,
                   const std::string& message);

    // X-Forwarded-For when a front proxy set it, else the socket peer.
    static std::string ClientAddress(const protocol::HttpRequest& req, const protocol::ResponseWriter& writer);

    const std::chrono::steady_clock::time_point startTime_;
    const GatewayOptions options_;
    backend::BackendPool pool_;
    backend::SessionCache<backend::ContentSource> sessions_;
    std::shared_ptr<stream::ObjectResolver> resolver_;
    stream::RangePlanner planner_;
    // Last member: connections and their writers go first.
    protocol::HttpServer server_;
};

} // namespace mediagate
