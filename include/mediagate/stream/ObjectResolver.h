#pragma once

#include "mediagate/backend/ContentSource.h"
#include "mediagate/common/noncopyable.h"
#include "mediagate/stream/TokenCodec.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace mediagate {
namespace network {
class EventLoop;
}

namespace stream {

struct ObjectMetadata {
    uint64_t size{0};
    std::optional<std::string> mimeType;
    std::string displayName;
    // Locator handed back to ContentSource::FetchChunk.
    std::string objectId;
};

enum class ResolveStatus {
    kOk,
    kInvalidHandle,
    kObjectNotFound,
    kBackendFailure,
};

struct ResolveResult {
    ResolveStatus status{ResolveStatus::kOk};
    ObjectMetadata metadata;
    // Set for kBackendFailure.
    backend::TransportError transportError{backend::TransportError::kNone};
};

// Turns the opaque handle from a request path into object metadata.
class ObjectResolver : mediagate::common::noncopyable {
public:
    using ResolveCallback = std::function<void(const ResolveResult& result)>;

    virtual ~ObjectResolver() = default;

    // `cb` runs on `loop`, possibly before Resolve() returns.
    virtual void Resolve(network::EventLoop* loop,
                         const std::string& handle,
                         const std::shared_ptr<backend::ContentSource>& session,
                         ResolveCallback cb) = 0;
};

// Handle = signed token, metadata = a Stat() on the backend session.
class TokenResolver : public ObjectResolver {
public:
    explicit TokenResolver(TokenCodec codec) : codec_(std::move(codec)) {}

    void Resolve(network::EventLoop* loop,
                 const std::string& handle,
                 const std::shared_ptr<backend::ContentSource>& session,
                 ResolveCallback cb) override;

    const TokenCodec& codec() const { return codec_; }

private:
    TokenCodec codec_;
};

} // namespace stream
} // namespace mediagate
