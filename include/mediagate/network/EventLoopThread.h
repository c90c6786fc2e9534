#pragma once

#include "mediagate/common/noncopyable.h"

#include <future>
#include <string>
#include <thread>

namespace mediagate {
namespace network {

class EventLoop;

// An I/O thread running exactly one EventLoop. The loop lives on the
// thread's stack; the destructor quits it and joins.
class EventLoopThread : mediagate::common::noncopyable {
public:
    explicit EventLoopThread(std::string name);
    ~EventLoopThread();

    // Spawns the thread and blocks until its loop is ready to accept work.
    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void Run(std::promise<EventLoop*> ready);

    const std::string name_;
    EventLoop* loop_ = nullptr;
    std::thread thread_;
};

} // namespace network
} // namespace mediagate
