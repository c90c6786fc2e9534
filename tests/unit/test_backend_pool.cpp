#include "mediagate/backend/BackendPool.h"
#include "mediagate/common/Config.h"
#include "mediagate/common/Logger.h"

#include <cassert>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mediagate::backend;
using namespace mediagate::common;

static std::vector<Backend> ThreeBackends() {
    return {{"backend:1", "127.0.0.1", 9001}, {"backend:2", "127.0.0.1", 9002}, {"backend:3", "127.0.0.1", 9003}};
}

void testSelectLeastLoaded() {
    BackendPool pool(ThreeBackends(), true);
    assert(pool.Select() == 0); // tie goes to the first

    pool.Increment(0);
    assert(pool.Select() == 1);
    pool.Increment(1);
    assert(pool.Select() == 2);
    pool.Increment(2);
    pool.Increment(2);
    assert(pool.Select() == 0);
    assert((pool.Loads() == std::vector<int>{1, 1, 2}));
    LOG_INFO << "Select Least Loaded PASS";
}

void testDecrementFloor() {
    BackendPool pool(ThreeBackends(), true);
    pool.Decrement(1);
    assert(pool.Load(1) == 0);
    pool.Increment(1);
    pool.Decrement(1);
    pool.Decrement(1);
    assert(pool.Load(1) == 0);
    LOG_INFO << "Decrement Floor PASS";
}

void testBadId() {
    BackendPool pool(ThreeBackends(), true);
    bool threw = false;
    try {
        pool.Increment(7);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Bad Id PASS";
}

void testLoadGuard() {
    BackendPool pool(ThreeBackends(), true);
    {
        auto guard = pool.Acquire(2);
        assert(guard.active());
        assert(pool.Load(2) == 1);

        BackendPool::LoadGuard moved(std::move(guard));
        assert(!guard.active());
        assert(pool.Load(2) == 1);

        moved.Release();
        assert(pool.Load(2) == 0);
        moved.Release();
        assert(pool.Load(2) == 0);

        auto again = pool.Acquire(2);
        assert(pool.Load(2) == 1);
    }
    assert(pool.Load(2) == 0);
    LOG_INFO << "Load Guard PASS";
}

void testAccountingDisabled() {
    BackendPool pool(ThreeBackends(), false);
    pool.Increment(0);
    auto guard = pool.Acquire(0);
    assert(!guard.active());
    assert(pool.Select() == 0);
    LOG_INFO << "Accounting Disabled PASS";
}

void testEmptyPool() {
    bool threw = false;
    try {
        BackendPool pool({}, true);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Empty Pool PASS";
}

void testConcurrentBalance() {
    BackendPool pool(ThreeBackends(), true);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&pool]() {
            for (int i = 0; i < 10000; ++i) {
                auto guard = pool.Acquire(pool.Select());
            }
        });
    }
    for (auto& t : threads) t.join();
    for (int load : pool.Loads()) assert(load == 0);
    LOG_INFO << "Concurrent Balance PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testSelectLeastLoaded();
    testDecrementFloor();
    testBadId();
    testLoadGuard();
    testAccountingDisabled();
    testEmptyPool();
    testConcurrentBalance();
    return 0;
}
