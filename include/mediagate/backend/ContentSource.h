#pragma once

#include "mediagate/common/noncopyable.h"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace mediagate {
namespace network {
class EventLoop;
}

namespace backend {

enum class TransportError {
    kNone,
    kConnectFailed,
    kConnectionClosed,
    kBadResponse,
    kNotFound,
    kTimeout,
    kShortChunk,
    kCancelled,
};

inline const char* TransportErrorName(TransportError e) {
    switch (e) {
        case TransportError::kNone: return "none";
        case TransportError::kConnectFailed: return "connect-failed";
        case TransportError::kConnectionClosed: return "connection-closed";
        case TransportError::kBadResponse: return "bad-response";
        case TransportError::kNotFound: return "not-found";
        case TransportError::kTimeout: return "timeout";
        case TransportError::kShortChunk: return "short-chunk";
        case TransportError::kCancelled: return "cancelled";
    }
    return "unknown";
}

// Thrown while building a session for a backend that cannot be reached at all.
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what) : std::runtime_error(what) {}
};

struct ObjectStat {
    uint64_t size{0};
    std::string contentType; // empty if the origin did not say
    std::string name;
};

struct StatResult {
    TransportError error{TransportError::kNone};
    ObjectStat stat;
};

// Streaming session against one backend. Callbacks run on the loop passed in.
class ContentSource : mediagate::common::noncopyable {
public:
    using StatCallback = std::function<void(const StatResult& result)>;
    using ChunkCallback = std::function<void(TransportError error, std::string data)>;

    virtual ~ContentSource() = default;

    virtual void Stat(network::EventLoop* loop, const std::string& objectId, StatCallback cb) = 0;

    // Up to `length` bytes starting at `offset`. Fewer bytes only at the end of the object.
    virtual void FetchChunk(network::EventLoop* loop,
                            const std::string& objectId,
                            uint64_t offset,
                            uint64_t length,
                            ChunkCallback cb) = 0;
};

} // namespace backend
} // namespace mediagate
