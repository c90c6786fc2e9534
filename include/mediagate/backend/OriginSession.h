#pragma once

#include "mediagate/backend/BackendConnectionPool.h"
#include "mediagate/backend/BackendPool.h"
#include "mediagate/backend/ContentSource.h"
#include "mediagate/network/InetAddress.h"

#include <memory>
#include <string>

namespace mediagate {
namespace backend {

// HTTP/1.1 origin speaking plain GET/HEAD with byte ranges on <prefix>/<object id>.
class OriginSession : public ContentSource,
                      public std::enable_shared_from_this<OriginSession> {
public:
    struct Options {
        std::string pathPrefix{"/objects"};
        int timeoutMs{15000};
        size_t maxIdlePerLoop{8};
    };

    // Resolves the backend host now; throws BackendUnavailable if it cannot.
    OriginSession(const Backend& backend, Options options);
    ~OriginSession() override;

    void Stat(network::EventLoop* loop, const std::string& objectId, StatCallback cb) override;
    void FetchChunk(network::EventLoop* loop,
                    const std::string& objectId,
                    uint64_t offset,
                    uint64_t length,
                    ChunkCallback cb) override;

    const Backend& backend() const { return backend_; }
    const network::InetAddress& address() const { return address_; }

    std::string RequestPath(const std::string& objectId) const;

private:
    std::string BuildRequest(const char* method, const std::string& objectId, const std::string& extraHeaders) const;

    const Backend backend_;
    const Options options_;
    network::InetAddress address_;
    std::unique_ptr<BackendConnectionPool> pool_;
};

} // namespace backend
} // namespace mediagate
