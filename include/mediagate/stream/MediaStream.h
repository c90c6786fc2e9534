#pragma once

#include "mediagate/backend/BackendPool.h"
#include "mediagate/backend/ContentSource.h"
#include "mediagate/common/noncopyable.h"

#include <cstdint>
#include <memory>
#include <string>

namespace mediagate {
namespace protocol {
class ResponseWriter;
}

namespace stream {

class ChunkSequencer;

// Pumps a ChunkSequencer into a ResponseWriter: the next chunk is requested
// only after the previous one has fully left the socket.
class MediaStream : mediagate::common::noncopyable,
                    public std::enable_shared_from_this<MediaStream> {
public:
    MediaStream(std::shared_ptr<ChunkSequencer> sequencer,
                std::shared_ptr<protocol::ResponseWriter> writer,
                std::shared_ptr<backend::BackendPool::LoadGuard> load);
    ~MediaStream();

    // The response head must already be out.
    void Start();

    uint64_t bytesSent() const { return bytesSent_; }

private:
    void Pump();
    void OnChunk(backend::TransportError error, std::string data);
    void OnClientGone();
    void ReleaseLoad();

    std::shared_ptr<ChunkSequencer> sequencer_;
    std::shared_ptr<protocol::ResponseWriter> writer_;
    std::shared_ptr<backend::BackendPool::LoadGuard> load_;
    uint64_t bytesSent_{0};
};

} // namespace stream
} // namespace mediagate
