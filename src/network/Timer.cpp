#include "mediagate/network/Timer.h"
#include "mediagate/network/Channel.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <sys/timerfd.h>
#include <unistd.h>

namespace mediagate {
namespace network {

Timer::Timer(EventLoop* loop, int delayMs, Callback cb)
    : loop_(loop), delayMs_(delayMs > 0 ? delayMs : 1), cb_(std::move(cb)) {
}

Timer::~Timer() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void Timer::Start() {
    if (done_ || channel_) return;

    fd_ = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd_ < 0) {
        LOG_ERROR << "Timer timerfd_create failed errno=" << errno;
        // Fire on the next loop turn rather than never.
        auto self = shared_from_this();
        loop_->QueueInLoop([self]() {
            if (self->done_) return;
            self->done_ = true;
            Callback cb = std::move(self->cb_);
            if (cb) cb();
        });
        return;
    }

    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = delayMs_ / 1000;
    howlong.it_value.tv_nsec = static_cast<long>(delayMs_ % 1000) * 1000 * 1000;
    if (::timerfd_settime(fd_, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "Timer timerfd_settime failed errno=" << errno;
    }

    channel_.reset(new Channel(loop_, fd_));
    channel_->SetReadCallback([this](std::chrono::system_clock::time_point) { HandleRead(); });
    channel_->EnableReading();
    self_ = shared_from_this();
}

void Timer::Cancel() {
    auto self = shared_from_this();
    loop_->RunInLoop([self]() { self->CancelInLoop(); });
}

void Timer::CancelInLoop() {
    if (done_) return;
    done_ = true;
    cb_ = nullptr;
    if (channel_) Teardown();
}

void Timer::HandleRead() {
    uint64_t expirations = 0;
    ssize_t n = ::read(fd_, &expirations, sizeof expirations);
    (void)n;
    if (done_) return;
    done_ = true;
    Callback cb = std::move(cb_);
    Teardown();
    if (cb) cb();
}

void Timer::Teardown() {
    channel_->DisableAll();
    channel_->Remove();
    // We may be inside this channel's own callback: free it on the next turn.
    Channel* ch = channel_.release();
    const int fd = fd_;
    fd_ = -1;
    std::shared_ptr<Timer> keep = std::move(self_);
    loop_->QueueInLoop([ch, fd, keep]() {
        delete ch;
        ::close(fd);
    });
}

} // namespace network
} // namespace mediagate
