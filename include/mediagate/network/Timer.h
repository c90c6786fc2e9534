#pragma once

#include "mediagate/common/noncopyable.h"

#include <functional>
#include <memory>

namespace mediagate {
namespace network {

class Channel;
class EventLoop;

// One-shot timerfd bound to a loop. The timer keeps itself alive while armed,
// so callers may drop their handle and still get the callback.
class Timer : mediagate::common::noncopyable,
              public std::enable_shared_from_this<Timer> {
public:
    using Callback = std::function<void()>;

    Timer(EventLoop* loop, int delayMs, Callback cb);
    ~Timer();

    // Loop thread only.
    void Start();
    // Thread safe. The callback never runs after Cancel() returns on the loop thread.
    void Cancel();

    bool done() const { return done_; }

private:
    void HandleRead();
    void CancelInLoop();
    void Teardown();

    EventLoop* loop_;
    int delayMs_;
    Callback cb_;
    int fd_{-1};
    std::unique_ptr<Channel> channel_;
    std::shared_ptr<Timer> self_;
    bool done_{false};
};

} // namespace network
} // namespace mediagate
