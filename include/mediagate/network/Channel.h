#pragma once

#include "mediagate/common/noncopyable.h"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace mediagate {
namespace network {

class EventLoop;

// Binds one fd to its interest set and dispatches ready events. Does not own the fd.
class Channel : mediagate::common::noncopyable {
public:
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(std::chrono::system_clock::time_point)>;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent(std::chrono::system_clock::time_point receiveTime);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // Events are dropped once `owner` is gone; while one runs, `owner` stays alive.
    void Tie(const std::shared_ptr<void>& owner);

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revents) { revents_ = revents; }
    bool IsNoneEvent() const { return events_ == 0; }

    void EnableReading() { SetInterest(events_ | kReadable); }
    void DisableReading() { SetInterest(events_ & ~kReadable); }
    void EnableWriting() { SetInterest(events_ | kWritable); }
    void DisableWriting() { SetInterest(events_ & ~kWritable); }
    void DisableAll() { SetInterest(0); }

    bool IsWriting() const { return (events_ & kWritable) != 0; }
    bool IsReading() const { return (events_ & kReadable) != 0; }

    // Registration state kept by the poller.
    int index() const { return index_; }
    void set_index(int index) { index_ = index; }

    EventLoop* owner_loop() { return loop_; }
    void Remove();

    // "IN HUP" style dump of the last ready set, for logs.
    std::string ReventsToString() const;

private:
    static const int kReadable;
    static const int kWritable;

    void SetInterest(int events);
    void Dispatch(std::chrono::system_clock::time_point receiveTime);

    EventLoop* loop_;
    const int fd_;
    int events_{0};
    int revents_{0};
    int index_{-1};
    bool tied_{false};
    bool dispatching_{false};
    std::weak_ptr<void> tie_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace mediagate
