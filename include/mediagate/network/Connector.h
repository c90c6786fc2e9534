#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/InetAddress.h"

#include <functional>
#include <memory>

namespace mediagate {
namespace network {

class Channel;
class EventLoop;

// One non-blocking connect() attempt per Start(). The outcome is reported
// once: a connected fd with err == 0, or fd == -1 and the errno. No retries.
class Connector : public std::enable_shared_from_this<Connector>,
                  mediagate::common::noncopyable {
public:
    using ResultCallback = std::function<void(int sockfd, int err)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetResultCallback(ResultCallback cb) { onResult_ = std::move(cb); }

    void Start();
    // Abandons an attempt in progress; no result is reported for it.
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum Phase { kIdle, kInProgress, kFinished };

    void Begin();
    void OnWritable();
    void Finish(int err);
    int ReleaseChannel();

    EventLoop* const loop_;
    const InetAddress serverAddr_;
    Phase phase_ = kIdle;
    bool wanted_ = false;
    std::unique_ptr<Channel> channel_;
    ResultCallback onResult_;
};

} // namespace network
} // namespace mediagate
