#include "mediagate/stream/MediaStream.h"
#include "mediagate/stream/ChunkSequencer.h"
#include "mediagate/protocol/ResponseWriter.h"
#include "mediagate/common/Logger.h"

namespace mediagate {
namespace stream {

using backend::TransportError;

MediaStream::MediaStream(std::shared_ptr<ChunkSequencer> sequencer,
                         std::shared_ptr<protocol::ResponseWriter> writer,
                         std::shared_ptr<backend::BackendPool::LoadGuard> load)
    : sequencer_(std::move(sequencer)),
      writer_(std::move(writer)),
      load_(std::move(load)) {
}

MediaStream::~MediaStream() {
    ReleaseLoad();
}

void MediaStream::Start() {
    std::weak_ptr<MediaStream> weak(shared_from_this());
    writer_->SetAbortCallback([weak]() {
        if (auto self = weak.lock()) self->OnClientGone();
    });
    Pump();
}

void MediaStream::Pump() {
    if (writer_->finished()) return;
    if (sequencer_->done()) {
        writer_->Finish();
        ReleaseLoad();
        return;
    }
    auto self = shared_from_this();
    sequencer_->Next([self](TransportError error, std::string data) {
        self->OnChunk(error, std::move(data));
    });
}

void MediaStream::OnChunk(TransportError error, std::string data) {
    if (writer_->finished()) return;
    if (error != TransportError::kNone) {
        // Headers are already out; the connection has to go.
        LOG_ERROR << "Stream aborted after " << bytesSent_ << " bytes: " << backend::TransportErrorName(error);
        writer_->Abort();
        ReleaseLoad();
        return;
    }
    bytesSent_ += data.size();
    auto self = shared_from_this();
    writer_->SendBody(data, [self]() { self->Pump(); });
}

void MediaStream::OnClientGone() {
    LOG_DEBUG << "Client left after " << bytesSent_ << " bytes";
    sequencer_->Cancel();
    ReleaseLoad();
}

void MediaStream::ReleaseLoad() {
    if (load_) {
        load_->Release();
        load_.reset();
    }
}

} // namespace stream
} // namespace mediagate
