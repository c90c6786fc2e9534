#include "mediagate/network/Channel.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include <sys/epoll.h>

namespace mediagate {
namespace network {

const int Channel::kReadable = EPOLLIN | EPOLLPRI;
const int Channel::kWritable = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd) : loop_(loop), fd_(fd) {
}

Channel::~Channel() {
    if (dispatching_) {
        LOG_ERROR << "Channel for fd " << fd_ << " destroyed inside its own event handler";
    }
}

void Channel::Tie(const std::shared_ptr<void>& owner) {
    tie_ = owner;
    tied_ = true;
}

void Channel::SetInterest(int events) {
    events_ = events;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(std::chrono::system_clock::time_point receiveTime) {
    if (!tied_) {
        Dispatch(receiveTime);
        return;
    }
    std::shared_ptr<void> owner = tie_.lock();
    if (owner) Dispatch(receiveTime);
}

void Channel::Dispatch(std::chrono::system_clock::time_point receiveTime) {
    dispatching_ = true;
    LOG_DEBUG << "fd " << fd_ << " ready: " << ReventsToString();

    // Hang-up with nothing left to read: the peer is gone.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN) && closeCallback_) closeCallback_();
    if ((revents_ & EPOLLERR) && errorCallback_) errorCallback_();
    if ((revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) && readCallback_) readCallback_(receiveTime);
    if ((revents_ & EPOLLOUT) && writeCallback_) writeCallback_();

    dispatching_ = false;
}

std::string Channel::ReventsToString() const {
    std::string out;
    auto add = [&out](const char* name) {
        if (!out.empty()) out += ' ';
        out += name;
    };
    if (revents_ & EPOLLIN) add("IN");
    if (revents_ & EPOLLPRI) add("PRI");
    if (revents_ & EPOLLOUT) add("OUT");
    if (revents_ & EPOLLHUP) add("HUP");
    if (revents_ & EPOLLRDHUP) add("RDHUP");
    if (revents_ & EPOLLERR) add("ERR");
    return out;
}

} // namespace network
} // namespace mediagate
