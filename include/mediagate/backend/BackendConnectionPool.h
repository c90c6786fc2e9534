#pragma once

#include "mediagate/common/noncopyable.h"
#include "mediagate/network/InetAddress.h"
#include "mediagate/network/TcpClient.h"

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mediagate {
namespace network {
class EventLoop;
}

namespace backend {

// Keep-alive connections to one backend, kept per event loop (one in-flight
// request per connection). Connections never cross loops.
class BackendConnectionPool : mediagate::common::noncopyable {
public:
    struct Config {
        size_t maxIdlePerLoop{8};
    };

    class Lease : mediagate::common::noncopyable {
    public:
        Lease(network::EventLoop* loop,
              std::shared_ptr<network::TcpClient> client,
              BackendConnectionPool* pool,
              bool reused);
        ~Lease();

        network::TcpConnectionPtr connection() const;
        // Taken from the idle list rather than freshly connected.
        bool reused() const { return reused_; }

        // keepAlive=true -> back to the idle list; else closed.
        void Release(bool keepAlive);

    private:
        network::EventLoop* loop_;
        std::shared_ptr<network::TcpClient> client_;
        BackendConnectionPool* pool_;
        bool reused_;
        bool released_{false};
    };

    // Always invoked on a later turn of the loop; a null lease means the connect failed.
    using AcquireCallback = std::function<void(std::shared_ptr<Lease> lease)>;

    BackendConnectionPool(const network::InetAddress& backend, Config cfg);
    ~BackendConnectionPool() = default;

    void Acquire(network::EventLoop* loop, AcquireCallback cb);

    size_t IdleCount(network::EventLoop* loop) const;
    const network::InetAddress& backendAddress() const { return backend_; }

private:
    void ReleaseInternal(network::EventLoop* loop, std::shared_ptr<network::TcpClient> client, bool keepAlive);
    void ParkIdle(network::EventLoop* loop, std::shared_ptr<network::TcpClient> client);

    const network::InetAddress backend_;
    const Config cfg_;
    mutable std::mutex mu_;
    std::unordered_map<network::EventLoop*, std::vector<std::shared_ptr<network::TcpClient>>> idle_;
};

} // namespace backend
} // namespace mediagate
