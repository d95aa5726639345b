#include "core/RollingTickBuffer.h"

#include <algorithm>

namespace lmv::core {

RollingTickBuffer::RollingTickBuffer(std::size_t capacity) : storage_(std::max<std::size_t>(capacity, 1)) {}

bool RollingTickBuffer::push(const domain::Tick& tick) {
    if (const auto* last = newest(); last && tick.timestamp < last->timestamp) {
        return false;
    }

    const std::size_t cap = storage_.size();
    if (size_ < cap) {
        storage_[(head_ + size_) % cap] = tick;
        ++size_;
    }
    else {
        storage_[head_] = tick;
        head_ = (head_ + 1) % cap;
        evicted_ = true;
    }
    return true;
}

bool RollingTickBuffer::replaceLast(const domain::Tick& tick) {
    if (size_ == 0) {
        return false;
    }
    auto& last = storage_[(head_ + size_ - 1) % storage_.size()];
    if (last.timestamp != tick.timestamp) {
        return false;
    }
    last = tick;
    return true;
}

void RollingTickBuffer::clear() {
    head_ = 0;
    size_ = 0;
    evicted_ = false;
}

TickWindow RollingTickBuffer::view() const noexcept {
    return TickWindow(storage_.data(), storage_.size(), head_, size_, evicted_);
}

std::vector<domain::Tick> RollingTickBuffer::snapshot() const {
    std::vector<domain::Tick> out;
    snapshotInto(out);
    return out;
}

void RollingTickBuffer::snapshotInto(std::vector<domain::Tick>& out) const {
    out.clear();
    out.reserve(size_);
    view().forEach([&out](const domain::Tick& tick) { out.push_back(tick); });
}

const domain::Tick* RollingTickBuffer::newest() const noexcept {
    if (size_ == 0) {
        return nullptr;
    }
    return &storage_[(head_ + size_ - 1) % storage_.size()];
}

}  // namespace lmv::core
