#include "mediagate/network/EpollPoller.h"
#include "mediagate/network/Channel.h"
#include "mediagate/common/Logger.h"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace mediagate {
namespace network {

namespace {
// Channel::index() values.
const int kNew = -1;
const int kAdded = 1;
const int kDeleted = 2;

const char* OperationName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
    }
    return "?";
}
} // namespace

EpollPoller::EpollPoller()
    : epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      events_(kInitEventListSize) {
    if (epollfd_ < 0) {
        LOG_FATAL << "epoll_create1 failed errno=" << errno;
    }
}

EpollPoller::~EpollPoller() {
    if (epollfd_ >= 0) ::close(epollfd_);
}

std::chrono::system_clock::time_point EpollPoller::Poll(int timeoutMs, ChannelList* active) {
    const int n = ::epoll_wait(epollfd_, events_.data(), static_cast<int>(events_.size()), timeoutMs);
    const int savedErrno = errno;
    const auto now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) LOG_ERROR << "epoll_wait errno=" << savedErrno;
        return now;
    }
    for (int i = 0; i < n; ++i) {
        auto* channel = static_cast<Channel*>(events_[i].data.ptr);
        channel->set_revents(static_cast<int>(events_[i].events));
        active->push_back(channel);
    }
    // A full batch means more may be waiting: grow for the next round.
    if (static_cast<size_t>(n) == events_.size()) events_.resize(events_.size() * 2);
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    const int index = channel->index();
    if (index == kNew) channels_[channel->fd()] = channel;

    if (index == kAdded) {
        if (channel->IsNoneEvent()) {
            Control(EPOLL_CTL_DEL, channel);
            channel->set_index(kDeleted);
        } else {
            Control(EPOLL_CTL_MOD, channel);
        }
        return;
    }

    // kNew or kDeleted: known to us, not in the epoll set.
    if (channel->IsNoneEvent()) {
        channel->set_index(kDeleted);
        return;
    }
    if (Control(EPOLL_CTL_ADD, channel)) channel->set_index(kAdded);
}

void EpollPoller::RemoveChannel(Channel* channel) {
    auto it = channels_.find(channel->fd());
    if (it != channels_.end() && it->second == channel) channels_.erase(it);
    if (channel->index() == kAdded) Control(EPOLL_CTL_DEL, channel);
    channel->set_index(kNew);
}

bool EpollPoller::HasChannel(Channel* channel) const {
    auto it = channels_.find(channel->fd());
    return it != channels_.end() && it->second == channel;
}

bool EpollPoller::Control(int operation, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof event);
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;
    if (::epoll_ctl(epollfd_, operation, channel->fd(), &event) == 0) return true;

    const int err = errno;
    if (operation == EPOLL_CTL_DEL) {
        LOG_ERROR << "epoll_ctl DEL fd=" << channel->fd() << " errno=" << err;
    } else {
        LOG_FATAL << "epoll_ctl " << OperationName(operation) << " fd=" << channel->fd() << " errno=" << err;
    }
    return false;
}

} // namespace network
} // namespace mediagate
