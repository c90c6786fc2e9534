#include "mediagate/network/EventLoopThread.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include <pthread.h>
#include <utility>

namespace mediagate {
namespace network {

EventLoopThread::EventLoopThread(std::string name)
    : name_(std::move(name)) {
}

EventLoopThread::~EventLoopThread() {
    if (!thread_.joinable()) {
        return;
    }
    // loop_ stays valid until Run() returns, and Run() only returns after Quit.
    loop_->Quit();
    thread_.join();
}

EventLoop* EventLoopThread::StartLoop() {
    std::promise<EventLoop*> ready;
    std::future<EventLoop*> loop = ready.get_future();
    thread_ = std::thread(&EventLoopThread::Run, this, std::move(ready));
    loop_ = loop.get();
    return loop_;
}

void EventLoopThread::Run(std::promise<EventLoop*> ready) {
    // Linux caps thread names at 15 characters.
    ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());

    EventLoop loop;
    ready.set_value(&loop);
    LOG_DEBUG << "I/O thread " << name_ << " running";
    loop.Loop();
    LOG_DEBUG << "I/O thread " << name_ << " exiting";
}

} // namespace network
} // namespace mediagate
