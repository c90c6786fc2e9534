#include "mediagate/network/EventLoop.h"
#include "mediagate/network/EpollPoller.h"
#include "mediagate/network/Timer.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <sys/eventfd.h>
#include <unistd.h>

namespace mediagate {
namespace network {

namespace {

thread_local EventLoop* t_loopInThisThread = nullptr;

const int kPollTimeMs = 10000;

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : quit_(false),
      handling_events_(false),
      thread_id_(std::this_thread::get_id()),
      poller_(new EpollPoller()),
      wakeup_fd_(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
    if (wakeup_fd_ < 0) {
        LOG_FATAL << "eventfd failed errno=" << errno;
    }
    if (t_loopInThisThread) {
        LOG_FATAL << "Another EventLoop " << t_loopInThisThread << " exists in thread " << thread_id_;
    } else {
        t_loopInThisThread = this;
    }

    wakeup_channel_.reset(new Channel(this, wakeup_fd_));
    wakeup_channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { DrainWakeup(); });
    wakeup_channel_->EnableReading();
}

EventLoop::~EventLoop() {
    wakeup_channel_->DisableAll();
    wakeup_channel_->Remove();
    ::close(wakeup_fd_);
    if (t_loopInThisThread == this) t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    quit_ = false;
    LOG_DEBUG << "EventLoop " << this << " running in thread " << thread_id_;

    // Work queued before the loop started.
    RunPendingFunctors();
    while (!quit_) {
        active_channels_.clear();
        const auto now = poller_->Poll(kPollTimeMs, &active_channels_);
        handling_events_ = true;
        for (Channel* channel : active_channels_) {
            channel->HandleEvent(now);
        }
        handling_events_ = false;
        RunPendingFunctors();
    }

    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) WakeUp();
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
    } else {
        QueueInLoop(std::move(cb));
    }
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_functors_.emplace_back(std::move(cb));
    }
    if (!IsInLoopThread() || !handling_events_) WakeUp();
}

std::shared_ptr<Timer> EventLoop::RunAfter(int delayMs, Functor cb) {
    auto timer = std::make_shared<Timer>(this, delayMs, std::move(cb));
    RunInLoop([timer]() { timer->Start(); });
    return timer;
}

void EventLoop::WakeUp() {
    const uint64_t one = 1;
    if (::write(wakeup_fd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_ERROR << "EventLoop " << this << " wake-up write failed errno=" << errno;
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeup_fd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_ERROR << "EventLoop " << this << " wake-up read failed errno=" << errno;
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) {
    return poller_->HasChannel(channel);
}

void EventLoop::RunPendingFunctors() {
    std::vector<Functor> functors;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        functors.swap(pending_functors_);
    }
    // Functors queued from here on land in the next round, after a wake-up.
    for (const Functor& functor : functors) {
        functor();
    }
}

} // namespace network
} // namespace mediagate
