#pragma once

#include <cstddef>
#include <vector>

#include "domain/Types.h"

namespace lmv::core {

// Read-only view over the ring, oldest to newest. Valid until the owning
// buffer is next mutated.
class TickWindow {
public:
    TickWindow() = default;
    TickWindow(const domain::Tick* data, std::size_t capacity, std::size_t head, std::size_t size, bool evicted)
        : data_(data), capacity_(capacity), head_(head), size_(size), evicted_(evicted) {}

    std::size_t size() const noexcept { return size_; }
    bool empty() const noexcept { return size_ == 0; }
    bool evicted() const noexcept { return evicted_; }

    const domain::Tick& operator[](std::size_t i) const noexcept { return data_[(head_ + i) % capacity_]; }
    const domain::Tick& front() const noexcept { return (*this)[0]; }
    const domain::Tick& back() const noexcept { return (*this)[size_ - 1]; }

    template <typename Fn>
    void forEach(Fn&& fn) const {
        for (std::size_t i = 0; i < size_; ++i) {
            fn((*this)[i]);
        }
    }

private:
    const domain::Tick* data_{nullptr};
    std::size_t capacity_{1};
    std::size_t head_{0};
    std::size_t size_{0};
    bool evicted_{false};
};

// Fixed capacity ring of the most recent ticks for one (venue, symbol).
// Not synchronized; the owner serializes access.
class RollingTickBuffer {
public:
    explicit RollingTickBuffer(std::size_t capacity);

    // Appends a tick, evicting the oldest entry when full. Ticks older than
    // the newest retained one are rejected.
    bool push(const domain::Tick& tick);

    // Overwrites the newest tick. Only accepted for the same timestamp.
    bool replaceLast(const domain::Tick& tick);

    void clear();

    TickWindow view() const noexcept;
    std::vector<domain::Tick> snapshot() const;
    void snapshotInto(std::vector<domain::Tick>& out) const;

    std::size_t size() const noexcept { return size_; }
    std::size_t capacity() const noexcept { return storage_.size(); }
    bool empty() const noexcept { return size_ == 0; }
    // True once at least one tick has been pushed out by capacity.
    bool hasEvicted() const noexcept { return evicted_; }
    const domain::Tick* newest() const noexcept;

private:
    std::vector<domain::Tick> storage_;
    std::size_t head_{0};
    std::size_t size_{0};
    bool evicted_{false};
};

}  // namespace lmv::core
