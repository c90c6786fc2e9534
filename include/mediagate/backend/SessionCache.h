#pragma once

#include "mediagate/common/noncopyable.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace mediagate {
namespace backend {

// One lazily built session per backend slot. Each slot has its own mutex, so
// building a slow session blocks only callers of the same slot. A factory that
// throws leaves the slot empty and the next caller tries again.
template <typename Session>
class SessionCache : mediagate::common::noncopyable {
public:
    using Factory = std::function<std::shared_ptr<Session>(size_t slot)>;

    SessionCache(size_t slots, Factory factory)
        : slots_(new Slot[slots]), size_(slots), factory_(std::move(factory)) {}

    size_t size() const { return size_; }

    std::shared_ptr<Session> GetOrCreate(size_t slot) {
        Slot& s = at(slot);
        std::lock_guard<std::mutex> lock(s.mu);
        if (!s.session) {
            s.session = factory_(slot);
        }
        return s.session;
    }

    // Never constructs.
    std::shared_ptr<Session> Peek(size_t slot) const {
        const Slot& s = at(slot);
        std::lock_guard<std::mutex> lock(s.mu);
        return s.session;
    }

    size_t constructed() const {
        size_t n = 0;
        for (size_t i = 0; i < size_; ++i) {
            if (Peek(i)) ++n;
        }
        return n;
    }

private:
    struct Slot {
        mutable std::mutex mu;
        std::shared_ptr<Session> session;
    };

    Slot& at(size_t slot) {
        if (slot >= size_) throw std::out_of_range("session slot");
        return slots_[slot];
    }
    const Slot& at(size_t slot) const {
        if (slot >= size_) throw std::out_of_range("session slot");
        return slots_[slot];
    }

    std::unique_ptr<Slot[]> slots_;
    const size_t size_;
    Factory factory_;
};

} // namespace backend
} // namespace mediagate
