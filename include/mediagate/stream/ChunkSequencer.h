#pragma once

#include "mediagate/backend/ContentSource.h"
#include "mediagate/common/noncopyable.h"
#include "mediagate/stream/RangePlanner.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace mediagate {
namespace network {
class EventLoop;
}

namespace stream {

// Pull-driven sequence of trimmed chunk buffers for one ChunkPlan. One fetch
// at a time, strictly in order; a failed fetch ends the sequence. Loop thread only.
class ChunkSequencer : mediagate::common::noncopyable,
                       public std::enable_shared_from_this<ChunkSequencer> {
public:
    using NextCallback = std::function<void(backend::TransportError error, std::string data)>;

    ChunkSequencer(network::EventLoop* loop,
                   std::shared_ptr<backend::ContentSource> source,
                   std::string objectId,
                   const ChunkPlan& plan);

    // Fetches and delivers the next buffer. Once done(), yields kCancelled.
    void Next(NextCallback cb);

    // No fetch is issued after this; an in-flight result is reported as kCancelled.
    void Cancel();

    // Every part delivered, or the sequence failed or was cancelled.
    bool done() const { return failed_ || cancelled_ || nextPart_ >= plan_.partCount; }
    bool cancelled() const { return cancelled_; }
    bool failed() const { return failed_; }
    uint64_t partsDelivered() const { return nextPart_; }
    uint64_t bytesDelivered() const { return bytesDelivered_; }
    const ChunkPlan& plan() const { return plan_; }

private:
    void OnChunk(uint64_t part, backend::TransportError error, std::string data, const NextCallback& cb);

    network::EventLoop* loop_;
    std::shared_ptr<backend::ContentSource> source_;
    const std::string objectId_;
    const ChunkPlan plan_;

    uint64_t nextPart_{0};
    uint64_t bytesDelivered_{0};
    bool inFlight_{false};
    bool failed_{false};
    bool cancelled_{false};
};

} // namespace stream
} // namespace mediagate
