#include "mediagate/network/EventLoopThreadPool.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/network/EventLoopThread.h"
#include "mediagate/common/Logger.h"

#include <utility>

namespace mediagate {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, std::string name)
    : baseLoop_(baseLoop),
      name_(std::move(name)) {
}

// Threads join in reverse start order.
EventLoopThreadPool::~EventLoopThreadPool() {
    while (!threads_.empty()) {
        threads_.pop_back();
    }
}

void EventLoopThreadPool::Start() {
    if (started_) {
        return;
    }
    started_ = true;
    threads_.reserve(numThreads_);
    loops_.reserve(numThreads_);
    for (int i = 0; i < numThreads_; ++i) {
        std::unique_ptr<EventLoopThread> t(new EventLoopThread(name_ + "-io-" + std::to_string(i)));
        loops_.push_back(t->StartLoop());
        threads_.push_back(std::move(t));
    }
    LOG_INFO << "Pool " << name_ << " started " << numThreads_ << " I/O thread(s)";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    if (loops_.empty()) {
        return baseLoop_;
    }
    EventLoop* loop = loops_[cursor_++ % loops_.size()];
    return loop;
}

} // namespace network
} // namespace mediagate
