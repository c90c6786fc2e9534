#include "mediagate/stream/ChunkSequencer.h"
#include "mediagate/common/Logger.h"

namespace mediagate {
namespace stream {

using backend::TransportError;

ChunkSequencer::ChunkSequencer(network::EventLoop* loop,
                               std::shared_ptr<backend::ContentSource> source,
                               std::string objectId,
                               const ChunkPlan& plan)
    : loop_(loop),
      source_(std::move(source)),
      objectId_(std::move(objectId)),
      plan_(plan) {
}

void ChunkSequencer::Next(NextCallback cb) {
    if (done() || inFlight_) {
        if (inFlight_) LOG_ERROR << "ChunkSequencer::Next while a fetch is in flight for " << objectId_;
        cb(TransportError::kCancelled, std::string());
        return;
    }

    const uint64_t part = nextPart_;
    const uint64_t offset = plan_.offset + part * plan_.chunkSize;
    inFlight_ = true;
    auto self = shared_from_this();
    source_->FetchChunk(loop_, objectId_, offset, plan_.chunkSize,
                        [self, part, cb](TransportError error, std::string data) {
                            self->OnChunk(part, error, std::move(data), cb);
                        });
}

void ChunkSequencer::Cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    LOG_DEBUG << "ChunkSequencer for " << objectId_ << " cancelled after " << nextPart_ << "/" << plan_.partCount
              << " parts";
}

void ChunkSequencer::OnChunk(uint64_t part, TransportError error, std::string data, const NextCallback& cb) {
    inFlight_ = false;
    if (cancelled_) {
        cb(TransportError::kCancelled, std::string());
        return;
    }
    if (error != TransportError::kNone) {
        failed_ = true;
        LOG_WARN << "Fetching part " << part << " of " << objectId_ << " failed: " << backend::TransportErrorName(error);
        cb(error, std::string());
        return;
    }

    const bool first = part == 0;
    const bool last = part + 1 == plan_.partCount;
    const uint64_t required = last ? plan_.lastCut : plan_.chunkSize;
    if (data.size() < required) {
        failed_ = true;
        LOG_WARN << "Part " << part << " of " << objectId_ << " is short: got " << data.size() << " of " << required
                 << " bytes";
        cb(TransportError::kShortChunk, std::string());
        return;
    }

    // Extra bytes from the source belong to the next chunk, not this one.
    data.resize(static_cast<size_t>(required));
    if (first && plan_.firstCut > 0) data.erase(0, static_cast<size_t>(plan_.firstCut));

    ++nextPart_;
    bytesDelivered_ += data.size();
    cb(TransportError::kNone, std::move(data));
}

} // namespace stream
} // namespace mediagate
