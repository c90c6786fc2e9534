#include "mediagate/backend/SessionCache.h"
#include "mediagate/common/Logger.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mediagate::backend;
using namespace mediagate::common;

struct FakeSession {
    explicit FakeSession(size_t s) : slot(s) {}
    size_t slot;
};

void testLazyConstruction() {
    int built = 0;
    SessionCache<FakeSession> cache(3, [&built](size_t slot) {
        ++built;
        return std::make_shared<FakeSession>(slot);
    });
    assert(cache.size() == 3);
    assert(cache.constructed() == 0);
    assert(!cache.Peek(1));

    auto a = cache.GetOrCreate(1);
    auto b = cache.GetOrCreate(1);
    assert(a == b);
    assert(a->slot == 1);
    assert(built == 1);
    assert(cache.constructed() == 1);
    assert(cache.Peek(1) == a);
    LOG_INFO << "Lazy Construction PASS";
}

void testFactoryFailureRetries() {
    int attempts = 0;
    SessionCache<FakeSession> cache(1, [&attempts](size_t slot) {
        if (++attempts == 1) throw std::runtime_error("unreachable");
        return std::make_shared<FakeSession>(slot);
    });
    bool threw = false;
    try {
        cache.GetOrCreate(0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(!cache.Peek(0));
    assert(cache.GetOrCreate(0));
    assert(attempts == 2);
    LOG_INFO << "Factory Failure Retries PASS";
}

void testOutOfRange() {
    SessionCache<FakeSession> cache(2, [](size_t slot) { return std::make_shared<FakeSession>(slot); });
    bool threw = false;
    try {
        cache.GetOrCreate(2);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
    LOG_INFO << "Out Of Range PASS";
}

void testConcurrentSingleConstruction() {
    std::atomic<int> built{0};
    SessionCache<FakeSession> cache(2, [&built](size_t slot) {
        ++built;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return std::make_shared<FakeSession>(slot);
    });
    std::vector<std::thread> threads;
    std::vector<std::shared_ptr<FakeSession>> seen(8);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&cache, &seen, i]() { seen[i] = cache.GetOrCreate(i % 2); });
    }
    for (auto& t : threads) t.join();
    assert(built == 2);
    for (size_t i = 0; i < seen.size(); ++i) {
        assert(seen[i] == cache.Peek(i % 2));
    }
    LOG_INFO << "Concurrent Single Construction PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testLazyConstruction();
    testFactoryFailureRetries();
    testOutOfRange();
    testConcurrentSingleConstruction();
    return 0;
}
