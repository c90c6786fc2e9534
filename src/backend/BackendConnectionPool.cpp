#include "mediagate/backend/BackendConnectionPool.h"
#include "mediagate/network/EventLoop.h"
#include "mediagate/common/Logger.h"

#include <utility>

namespace mediagate {
namespace backend {

BackendConnectionPool::Lease::Lease(network::EventLoop* loop,
                                    std::shared_ptr<network::TcpClient> client,
                                    BackendConnectionPool* pool,
                                    bool reused)
    : loop_(loop), client_(std::move(client)), pool_(pool), reused_(reused) {
}

BackendConnectionPool::Lease::~Lease() {
    Release(false);
}

network::TcpConnectionPtr BackendConnectionPool::Lease::connection() const {
    if (!client_) return {};
    return client_->connection();
}

void BackendConnectionPool::Lease::Release(bool keepAlive) {
    if (released_) return;
    released_ = true;
    pool_->ReleaseInternal(loop_, std::move(client_), keepAlive);
    client_.reset();
}

BackendConnectionPool::BackendConnectionPool(const network::InetAddress& backend, Config cfg)
    : backend_(backend), cfg_(cfg) {
}

void BackendConnectionPool::Acquire(network::EventLoop* loop, AcquireCallback cb) {
    // Fast path: an idle connection on this loop.
    std::shared_ptr<network::TcpClient> reusable;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto& idle = idle_[loop];
        while (!idle.empty()) {
            auto client = std::move(idle.back());
            idle.pop_back();
            auto conn = client ? client->connection() : network::TcpConnectionPtr();
            if (conn && conn->connected()) {
                reusable = std::move(client);
                break;
            }
        }
    }
    if (reusable) {
        auto lease = std::make_shared<Lease>(loop, std::move(reusable), this, true);
        loop->QueueInLoop([cb, lease]() { cb(lease); });
        return;
    }

    auto client = std::make_shared<network::TcpClient>(loop, backend_, "origin");
    std::weak_ptr<network::TcpClient> weakClient(client);
    // The client keeps itself alive through this holder until the connect settles.
    auto holder = std::make_shared<std::shared_ptr<network::TcpClient>>(client);
    auto settled = std::make_shared<bool>(false);

    client->SetConnectionCallback([this, loop, cb, weakClient, holder, settled](const network::TcpConnectionPtr& conn) {
        if (*settled) return;
        *settled = true;
        auto strong = weakClient.lock();
        std::shared_ptr<Lease> lease;
        if (strong && conn->connected()) {
            lease = std::make_shared<Lease>(loop, strong, this, false);
        }
        loop->QueueInLoop([cb, lease, holder]() {
            holder->reset();
            cb(lease);
        });
    });
    client->SetConnectFailedCallback([loop, cb, holder, settled](int err) {
        if (*settled) return;
        *settled = true;
        LOG_DEBUG << "BackendConnectionPool connect failed errno=" << err;
        loop->QueueInLoop([cb, holder]() {
            holder->reset();
            cb(nullptr);
        });
    });
    client->Connect();
}

void BackendConnectionPool::ReleaseInternal(network::EventLoop* loop,
                                            std::shared_ptr<network::TcpClient> client,
                                            bool keepAlive) {
    if (!client) return;
    // The caller may be running inside one of this connection's callbacks:
    // callbacks are swapped and the client freed on the next turn.
    if (!keepAlive) {
        loop->QueueInLoop([client]() mutable { client.reset(); });
        return;
    }
    loop->QueueInLoop([this, loop, client]() { ParkIdle(loop, client); });
}

void BackendConnectionPool::ParkIdle(network::EventLoop* loop, std::shared_ptr<network::TcpClient> client) {
    auto conn = client->connection();
    if (!conn || !conn->connected()) return;

    // Anything an idle origin sends is out of protocol.
    conn->SetConnectionCallback(network::ConnectionCallback());
    conn->SetMessageCallback([](const network::TcpConnectionPtr& c, network::Buffer* buf,
                                std::chrono::system_clock::time_point) {
        LOG_WARN << "Unexpected " << buf->ReadableBytes() << " bytes on idle origin connection " << c->name();
        buf->RetrieveAll();
        c->ForceClose();
    });
    conn->SetWriteCompleteCallback(network::WriteCompleteCallback());

    std::lock_guard<std::mutex> lock(mu_);
    auto& idle = idle_[loop];
    if (idle.size() >= cfg_.maxIdlePerLoop) return;
    idle.push_back(std::move(client));
}

size_t BackendConnectionPool::IdleCount(network::EventLoop* loop) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = idle_.find(loop);
    return it == idle_.end() ? 0 : it->second.size();
}

} // namespace backend
} // namespace mediagate
