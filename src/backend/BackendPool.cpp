#include "mediagate/backend/BackendPool.h"
#include "mediagate/common/Config.h"
#include "mediagate/common/Logger.h"

#include <stdexcept>

namespace mediagate {
namespace backend {

void BackendPool::LoadGuard::Release() {
    if (pool_ == nullptr) return;
    pool_->Decrement(id_);
    pool_ = nullptr;
}

BackendPool::BackendPool(std::vector<Backend> backends, bool loadAccounting)
    : backends_(std::move(backends)),
      loadAccounting_(loadAccounting) {
    if (backends_.empty()) {
        throw common::ConfigError("backend pool is empty: configure at least one [backend:N] section");
    }
    loads_.reset(new std::atomic<int>[backends_.size()]);
    for (size_t i = 0; i < backends_.size(); ++i) {
        loads_[i].store(0, std::memory_order_relaxed);
    }
    LOG_INFO << "BackendPool with " << backends_.size() << " backend(s), load accounting "
             << (loadAccounting_ ? "on" : "off");
}

BackendId BackendPool::Select() const {
    if (!loadAccounting_) return 0;
    BackendId best = 0;
    int bestLoad = loads_[0].load(std::memory_order_relaxed);
    for (size_t i = 1; i < backends_.size(); ++i) {
        const int load = loads_[i].load(std::memory_order_relaxed);
        if (load < bestLoad) {
            bestLoad = load;
            best = i;
        }
    }
    return best;
}

void BackendPool::Increment(BackendId id) {
    if (id >= backends_.size()) throw std::out_of_range("backend id");
    loads_[id].fetch_add(1, std::memory_order_relaxed);
}

void BackendPool::Decrement(BackendId id) {
    if (id >= backends_.size()) throw std::out_of_range("backend id");
    int cur = loads_[id].load(std::memory_order_relaxed);
    while (cur > 0 && !loads_[id].compare_exchange_weak(cur, cur - 1, std::memory_order_relaxed)) {
    }
    if (cur <= 0) {
        LOG_WARN << "BackendPool load of backend " << id << " would drop below zero";
    }
}

int BackendPool::Load(BackendId id) const {
    return loads_[id].load(std::memory_order_relaxed);
}

std::vector<int> BackendPool::Loads() const {
    std::vector<int> out;
    out.reserve(backends_.size());
    for (size_t i = 0; i < backends_.size(); ++i) {
        out.push_back(loads_[i].load(std::memory_order_relaxed));
    }
    return out;
}

BackendPool::LoadGuard BackendPool::Acquire(BackendId id) {
    if (!loadAccounting_) return LoadGuard();
    Increment(id);
    return LoadGuard(this, id);
}

} // namespace backend
} // namespace mediagate
