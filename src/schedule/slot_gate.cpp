#include "code_sentinel/schedule/slot_gate.hpp"
#include "code_sentinel/common/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace code_sentinel {
namespace schedule {

SlotLease::~SlotLease() {
    release();
}

SlotLease::SlotLease(SlotLease&& other) noexcept : gate_(other.gate_) {
    other.gate_ = nullptr;
}

SlotLease& SlotLease::operator=(SlotLease&& other) noexcept {
    if (this != &other) {
        release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

void SlotLease::release() {
    if (gate_) {
        gate_->returnSlot();
        gate_ = nullptr;
    }
}

SlotGate::SlotGate(size_t capacity) : capacity_(capacity) {
    if (capacity == 0) {
        throw std::invalid_argument("SlotGate capacity must be positive");
    }
}

SlotLease SlotGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return in_use_ < capacity_; });

    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return SlotLease(this);
}

void SlotGate::returnSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ == 0) {
            common::Logger::instance().error("[SlotGate] Slot returned twice | capacity={}", capacity_);
            return;
        }
        --in_use_;
    }
    cv_.notify_one();
}

size_t SlotGate::inUse() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

size_t SlotGate::peak() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_;
}

}}
