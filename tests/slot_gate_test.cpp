#include <gtest/gtest.h>
#include "code_sentinel/schedule/slot_gate.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using code_sentinel::schedule::SlotGate;
using code_sentinel::schedule::SlotLease;

TEST(SlotGateTest, ZeroCapacityIsRejected) {
    EXPECT_THROW(SlotGate gate(0), std::invalid_argument);
}

TEST(SlotGateTest, LeasesReturnSlotsOnDestruction) {
    SlotGate gate(2);
    {
        SlotLease first = gate.acquire();
        SlotLease second = gate.acquire();
        EXPECT_TRUE(first.held());
        EXPECT_EQ(gate.inUse(), 2u);
    }
    EXPECT_EQ(gate.inUse(), 0u);
    EXPECT_EQ(gate.peak(), 2u);
}

TEST(SlotGateTest, ExplicitReleaseIsIdempotent) {
    SlotGate gate(1);
    SlotLease lease = gate.acquire();
    lease.release();
    EXPECT_FALSE(lease.held());
    lease.release();
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(SlotGateTest, MovedLeaseKeepsTheSlot) {
    SlotGate gate(1);
    SlotLease original = gate.acquire();
    SlotLease moved(std::move(original));

    EXPECT_FALSE(original.held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(gate.inUse(), 1u);

    SlotLease assigned;
    assigned = std::move(moved);
    EXPECT_EQ(gate.inUse(), 1u);
    assigned.release();
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(SlotGateTest, BoundsConcurrentHolders) {
    SlotGate gate(3);
    std::atomic<int> holders{0};
    std::atomic<int> max_holders{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&] {
            SlotLease lease = gate.acquire();
            int now = ++holders;
            int seen = max_holders.load();
            while (now > seen && !max_holders.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --holders;
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_LE(max_holders.load(), 3);
    EXPECT_LE(gate.peak(), 3u);
    EXPECT_EQ(gate.inUse(), 0u);
}

TEST(SlotGateTest, AcquireBlocksUntilRelease) {
    SlotGate gate(1);
    SlotLease held = gate.acquire();
    std::atomic<bool> acquired{false};

    std::thread waiter([&] {
        SlotLease lease = gate.acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(acquired.load());

    held.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());
}
