#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/Channel.h"

namespace mediagate {
namespace network {

class EpollPoller;
class Timer;

// One loop per thread. Everything touching a channel runs on the owning thread;
// other threads hand work over with RunInLoop/QueueInLoop.
class EventLoop : mediagate::common::noncopyable {
public:
    using Functor = std::function<void()>;

    EventLoop();
    ~EventLoop();

    void Loop();
    // Thread safe. The current iteration finishes first.
    void Quit();

    void RunInLoop(Functor cb);
    // Always deferred, even on the loop thread. Runs after the current batch of events.
    void QueueInLoop(Functor cb);

    // One-shot timer on this loop. Cancel() through the returned handle.
    std::shared_ptr<Timer> RunAfter(int delayMs, Functor cb);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel);

    bool IsInLoopThread() const { return thread_id_ == std::this_thread::get_id(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void WakeUp();
    void DrainWakeup();
    void RunPendingFunctors();

    std::atomic_bool quit_;
    // Set while dispatching channel events; functors queued then need no wake-up.
    bool handling_events_;

    const std::thread::id thread_id_;
    std::unique_ptr<EpollPoller> poller_;

    int wakeup_fd_;
    std::unique_ptr<Channel> wakeup_channel_;

    std::vector<Channel*> active_channels_;

    std::mutex mutex_;
    std::vector<Functor> pending_functors_;
};

} // namespace network
} // namespace mediagate
