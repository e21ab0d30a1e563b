#include <gtest/gtest.h>

#include "port_allocator.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <limits>
#include <set>
#include <thread>
#include <vector>
#include <mutex>

using namespace mcphub;
using mcphub::testing::PortHolder;

namespace {

// A base port whose whole probe window is free right now.
int free_base(int attempts) {
    int base = 42000 + static_cast<int>(::getpid() % 400) * 40;
    for (int tries = 0; tries < 50; tries++, base += attempts) {
        bool all_free = true;
        for (int p = base; p < base + attempts && all_free; p++) {
            all_free = PortAllocator::os_port_free(p);
        }
        if (all_free) return base;
    }
    return base;
}

} // namespace

TEST(PortAllocator, AllocatesFromBase)
{
    int base = free_base(10);
    PortAllocator ports(base, 10);
    int p = ports.allocate("a");
    EXPECT_EQ(p, base);
    EXPECT_TRUE(ports.is_reserved(p));
    EXPECT_FALSE(ports.is_free(p));
    EXPECT_EQ(ports.ports_of("a"), std::vector<int>{p});
}

TEST(PortAllocator, NeverHandsOutAReservedPort)
{
    int base = free_base(10);
    PortAllocator ports(base, 10);
    int a = ports.allocate("a");
    int b = ports.allocate("b");
    EXPECT_NE(a, b);
    EXPECT_EQ(b, base + 1);
}

TEST(PortAllocator, PreferredPortBoundElsewhereFallsToNext)
{
    int base = free_base(10);
    PortHolder holder(base + 3);
    ASSERT_TRUE(holder.held());

    PortAllocator ports(base, 10);
    int p = ports.allocate("s", base + 3);
    EXPECT_EQ(p, base + 4);
}

TEST(PortAllocator, PreferredPortTakenWhenFree)
{
    int base = free_base(10);
    PortAllocator ports(base, 10);
    EXPECT_EQ(ports.allocate("s", base + 5), base + 5);
}

TEST(PortAllocator, SkipsPortsBoundByOtherProcesses)
{
    int base = free_base(10);
    PortHolder holder(base);
    ASSERT_TRUE(holder.held());

    PortAllocator ports(base, 10);
    EXPECT_EQ(ports.allocate("s"), base + 1);
}

TEST(PortAllocator, ExhaustionAfterMaxAttempts)
{
    int base = free_base(3);
    PortAllocator ports(base, 3);
    ports.allocate("a");
    ports.allocate("b");
    ports.allocate("c");
    try {
        ports.allocate("d");
        FAIL() << "expected PortExhaustion";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::port_exhaustion);
        EXPECT_EQ(e.server(), "d");
    }
}

TEST(PortAllocator, ReleaseIsIdempotent)
{
    int base = free_base(5);
    PortAllocator ports(base, 5);
    int p = ports.allocate("a");
    ports.release(p);
    EXPECT_FALSE(ports.is_reserved(p));
    ports.release(p);
    ports.release(p + 1000);
    EXPECT_TRUE(ports.bindings().empty());
    EXPECT_EQ(ports.allocate("b"), p);
}

TEST(PortAllocator, ReleaseOwnerLeavesOthers)
{
    int base = free_base(5);
    PortAllocator ports(base, 5);
    ports.allocate("a");
    ports.allocate("a");
    int other = ports.allocate("b");
    ports.release_owner("a");
    EXPECT_TRUE(ports.ports_of("a").empty());
    EXPECT_EQ(ports.ports_of("b"), std::vector<int>{other});
}

TEST(PortAllocator, AdoptRespectsExistingOwner)
{
    int base = free_base(5);
    PortAllocator ports(base, 5);
    EXPECT_TRUE(ports.adopt(base + 2, "old"));
    EXPECT_TRUE(ports.adopt(base + 2, "old"));
    EXPECT_FALSE(ports.adopt(base + 2, "other"));
    EXPECT_NE(ports.allocate("new"), base + 2);
}

TEST(PortAllocator, ConcurrentAllocationsAreDistinct)
{
    int base = free_base(20);
    PortAllocator ports(base, 20);
    std::mutex mu;
    std::set<int> seen;
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; i++) {
        threads.emplace_back([&, i]() {
            int p = ports.allocate("t" + std::to_string(i));
            std::lock_guard<std::mutex> lock(mu);
            seen.insert(p);
        });
    }
    for (auto& t : threads) t.join();
    EXPECT_EQ(seen.size(), 10u);
}

TEST(PortAllocator, OsProbeRejectsInvalidPorts)
{
    EXPECT_FALSE(PortAllocator::os_port_free(0));
    EXPECT_FALSE(PortAllocator::os_port_free(70000));
}

TEST(PortAllocator, PreferredPortAboveRangeIsRejected)
{
    PortAllocator ports(free_base(3), 3);
    for (int bad : {65536, std::numeric_limits<int>::max()}) {
        try {
            ports.allocate("wide", bad);
            FAIL() << "expected ConfigError for " << bad;
        } catch (const HubError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::config_error);
            EXPECT_EQ(e.server(), "wide");
        }
    }
    EXPECT_TRUE(ports.ports_of("wide").empty());
}
