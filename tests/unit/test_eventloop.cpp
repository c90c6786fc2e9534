#include "mediagate/network/EventLoop.h"
#include "mediagate/network/EventLoopThreadPool.h"
#include "mediagate/network/Timer.h"
#include "mediagate/common/Logger.h"
#include <atomic>
#include <cassert>
#include <chrono>
#include <set>
#include <thread>

using namespace mediagate::network;
using namespace mediagate::common;

void testQueueFromOtherThread() {
    EventLoop loop;
    std::atomic<int> ran{0};

    std::thread t([&loop, &ran]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        loop.QueueInLoop([&loop, &ran]() {
            assert(loop.IsInLoopThread());
            ++ran;
            loop.Quit();
        });
    });

    loop.Loop();
    t.join();
    assert(ran == 1);
    LOG_INFO << "Queue From Other Thread PASS";
}

void testTimers() {
    EventLoop loop;
    bool fired = false;
    bool cancelledFired = false;
    const auto start = std::chrono::steady_clock::now();

    auto cancelled = loop.RunAfter(50, [&cancelledFired]() { cancelledFired = true; });
    // Handle dropped on purpose: the timer must still fire.
    loop.RunAfter(100, [&loop, &fired]() {
        fired = true;
        loop.Quit();
    });
    loop.RunInLoop([cancelled]() { cancelled->Cancel(); });

    loop.Loop();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    assert(fired);
    assert(!cancelledFired);
    assert(elapsed.count() >= 90);
    LOG_INFO << "Timers PASS";
}

void testThreadPool() {
    EventLoop base;
    EventLoopThreadPool pool(&base, "test");
    pool.SetThreadNum(3);
    pool.Start();
    assert(pool.loopCount() == 3);

    std::set<EventLoop*> loops;
    for (int i = 0; i < 6; ++i) loops.insert(pool.GetNextLoop());
    assert(loops.size() == 3);
    assert(loops.count(&base) == 0);

    std::atomic<int> done{0};
    for (EventLoop* l : loops) {
        l->QueueInLoop([l, &done, &base]() {
            assert(l->IsInLoopThread());
            if (++done == 3) base.QueueInLoop([&base]() { base.Quit(); });
        });
    }
    base.Loop();
    assert(done == 3);
    LOG_INFO << "Thread Pool PASS";
}

void testEmptyThreadPool() {
    EventLoop base;
    EventLoopThreadPool pool(&base, "empty");
    pool.Start();
    assert(pool.loopCount() == 1);
    assert(pool.GetNextLoop() == &base);
    assert(pool.GetNextLoop() == &base);
    LOG_INFO << "Empty Thread Pool PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testQueueFromOtherThread();
    testTimers();
    testThreadPool();
    testEmptyThreadPool();
    return 0;
}
