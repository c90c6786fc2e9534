#pragma once

#include "mediagate/common/noncopyable.h"

#include <memory>
#include <string>
#include <vector>

namespace mediagate {
namespace network {

class EventLoop;
class EventLoopThread;

// I/O threads behind a TcpServer. Connections are spread over the loops
// round robin; with zero threads everything runs on the base loop.
class EventLoopThreadPool : mediagate::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, std::string name);
    ~EventLoopThreadPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads < 0 ? 0 : numThreads; }
    void Start();

    EventLoop* GetNextLoop();

    size_t loopCount() const { return loops_.empty() ? 1 : loops_.size(); }
    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* const baseLoop_;
    const std::string name_;
    int numThreads_ = 0;
    bool started_ = false;
    size_t cursor_ = 0;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace mediagate
