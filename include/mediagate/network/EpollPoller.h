#pragma once

#include "mediagate/common/noncopyable.h"

#include <sys/epoll.h>

#include <chrono>
#include <unordered_map>
#include <vector>

namespace mediagate {
namespace network {

class Channel;

// Level-triggered epoll set owned by one EventLoop. Not thread safe.
class EpollPoller : mediagate::common::noncopyable {
public:
    using ChannelList = std::vector<Channel*>;

    EpollPoller();
    ~EpollPoller();

    // Waits up to timeoutMs and appends ready channels. Returns the wake-up time.
    std::chrono::system_clock::time_point Poll(int timeoutMs, ChannelList* active);

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    size_t channelCount() const { return channels_.size(); }

private:
    static const int kInitEventListSize = 16;

    bool Control(int operation, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> events_;
    std::unordered_map<int, Channel*> channels_;
};

} // namespace network
} // namespace mediagate
