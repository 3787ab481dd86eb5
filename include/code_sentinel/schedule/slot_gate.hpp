#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace code_sentinel {
namespace schedule {

class SlotGate;

// Holds one slot of a SlotGate until destroyed or released.
class SlotLease {
public:
    SlotLease() = default;
    ~SlotLease();

    SlotLease(SlotLease&& other) noexcept;
    SlotLease& operator=(SlotLease&& other) noexcept;

    SlotLease(const SlotLease&) = delete;
    SlotLease& operator=(const SlotLease&) = delete;

    void release();
    bool held() const { return gate_ != nullptr; }

private:
    friend class SlotGate;
    explicit SlotLease(SlotGate* gate) : gate_(gate) {}

    SlotGate* gate_ = nullptr;
};

// Counting gate: at most capacity() leases exist at any moment.
class SlotGate {
public:
    explicit SlotGate(size_t capacity);

    SlotGate(const SlotGate&) = delete;
    SlotGate& operator=(const SlotGate&) = delete;

    // Blocks until a slot is free.
    SlotLease acquire();

    size_t capacity() const { return capacity_; }
    size_t inUse() const;
    size_t peak() const;

private:
    friend class SlotLease;
    void returnSlot();

    const size_t capacity_;
    size_t in_use_ = 0;
    size_t peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}}
