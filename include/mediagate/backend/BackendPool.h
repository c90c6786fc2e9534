#pragma once

#include "mediagate/common/noncopyable.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace mediagate {
namespace backend {

struct Backend {
    std::string name;
    std::string host;
    uint16_t port{0};
};

// Position in the configured pool. Stable for the life of the process.
using BackendId = size_t;

// Least-loaded selection over a fixed backend list. One atomic counter per
// backend, no lock: Select() reads a snapshot that may be stale by the time
// the caller increments, which only skews balance.
class BackendPool : mediagate::common::noncopyable {
public:
    // Holds one unit of load on a backend until destroyed or Release()d.
    class LoadGuard {
    public:
        LoadGuard() = default;
        ~LoadGuard() { Release(); }
        LoadGuard(LoadGuard&& other) noexcept : pool_(other.pool_), id_(other.id_) { other.pool_ = nullptr; }
        LoadGuard& operator=(LoadGuard&& other) noexcept {
            if (this != &other) {
                Release();
                pool_ = other.pool_;
                id_ = other.id_;
                other.pool_ = nullptr;
            }
            return *this;
        }
        LoadGuard(const LoadGuard&) = delete;
        LoadGuard& operator=(const LoadGuard&) = delete;

        void Release();
        bool active() const { return pool_ != nullptr; }
        BackendId id() const { return id_; }

    private:
        friend class BackendPool;
        LoadGuard(BackendPool* pool, BackendId id) : pool_(pool), id_(id) {}

        BackendPool* pool_{nullptr};
        BackendId id_{0};
    };

    // Throws common::ConfigError on an empty list.
    BackendPool(std::vector<Backend> backends, bool loadAccounting);

    size_t size() const { return backends_.size(); }
    const Backend& backend(BackendId id) const { return backends_.at(id); }
    const std::vector<Backend>& backends() const { return backends_; }
    bool loadAccounting() const { return loadAccounting_; }

    // First backend with the smallest load; backend 0 when accounting is off.
    BackendId Select() const;

    void Increment(BackendId id);
    // Never goes below zero.
    void Decrement(BackendId id);
    int Load(BackendId id) const;
    std::vector<int> Loads() const;

    // Increments now, decrements when the guard dies. No-op guard when accounting is off.
    LoadGuard Acquire(BackendId id);

private:
    std::vector<Backend> backends_;
    const bool loadAccounting_;
    std::unique_ptr<std::atomic<int>[]> loads_;
};

} // namespace backend
} // namespace mediagate
