/*
 * Operation lock registry tests - CLI-Gateway
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <cli-gateway/exec/operation_lock.hpp>
#include <cli-gateway/exec/target.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace cligate;

TEST(OperationLock, SameKindConflicts) {
    OperationLockRegistry reg;
    EXPECT_TRUE(reg.try_acquire("build", "/work/app").granted);
    auto second = reg.try_acquire("build", "/work/app");
    EXPECT_FALSE(second.granted);
    ASSERT_TRUE(second.holder.has_value());
    EXPECT_EQ(second.holder->operation_kind, "build");
    EXPECT_EQ(second.holder->target, "/work/app");
}

TEST(OperationLock, DifferentKindConflicts) {
    OperationLockRegistry reg;
    EXPECT_TRUE(reg.try_acquire("build", "/work/app").granted);
    auto r = reg.try_acquire("package_add", "/work/app");
    EXPECT_FALSE(r.granted);
    ASSERT_TRUE(r.holder.has_value());
    EXPECT_EQ(r.holder->operation_kind, "build");
}

TEST(OperationLock, ReleaseAllowsReacquire) {
    OperationLockRegistry reg;
    EXPECT_TRUE(reg.try_acquire("test", "/work/app").granted);
    reg.release("test", "/work/app");
    EXPECT_TRUE(reg.try_acquire("test", "/work/app").granted);
    EXPECT_EQ(reg.held_count(), 1u);
}

TEST(OperationLock, ReleaseWithoutLockIsNoop) {
    OperationLockRegistry reg;
    reg.release("build", "/never/held");
    reg.release("build", "/never/held");
    EXPECT_EQ(reg.held_count(), 0u);
}

TEST(OperationLock, DistinctTargetsDoNotConflict) {
    OperationLockRegistry reg;
    std::atomic<int> granted{0};
    std::thread a([&]{ if (reg.try_acquire("build", "/work/a").granted) ++granted; });
    std::thread b([&]{ if (reg.try_acquire("publish", "/work/b").granted) ++granted; });
    a.join(); b.join();
    EXPECT_EQ(granted.load(), 2);
}

TEST(OperationLock, EquivalentPathsShareOneKey) {
    OperationLockRegistry reg;
    EXPECT_TRUE(reg.try_acquire("build", "/work/app/").granted);
    EXPECT_FALSE(reg.try_acquire("build", "/work/other/../app").granted);
    EXPECT_FALSE(reg.try_acquire("build", "\\work\\app").granted);
    reg.release("build", "/work/./app");
    EXPECT_EQ(reg.held_count(), 0u);
}

TEST(OperationLock, OnlyOneConcurrentWinner) {
    OperationLockRegistry reg;
    std::atomic<int> granted{0};
    std::vector<std::thread> ts;
    for (int i = 0; i < 16; ++i)
        ts.emplace_back([&, i]{ if (reg.try_acquire(i % 2 ? "build" : "run", "/work/race").granted) ++granted; });
    for (auto &t : ts) t.join();
    EXPECT_EQ(granted.load(), 1);
}

TEST(OperationLock, ClearReleasesEverything) {
    OperationLockRegistry reg;
    EXPECT_TRUE(reg.try_acquire("build", "/a").granted);
    EXPECT_TRUE(reg.try_acquire("run", "/b").granted);
    EXPECT_TRUE(reg.try_acquire("test", "/c").granted);
    reg.clear();
    EXPECT_EQ(reg.held_count(), 0u);
    EXPECT_TRUE(reg.try_acquire("build", "/a").granted);
    EXPECT_TRUE(reg.try_acquire("build", "/b").granted);
    EXPECT_TRUE(reg.try_acquire("build", "/c").granted);
}

TEST(OperationLock, HolderLookup) {
    OperationLockRegistry reg;
    EXPECT_FALSE(reg.holder("/a").has_value());
    reg.try_acquire("format", "/a");
    auto h = reg.holder("/a/");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->operation_kind, "format");
    EXPECT_EQ(reg.held().size(), 1u);
}

TEST(OperationLease, ReleasesOnDestruction) {
    OperationLockRegistry reg;
    ASSERT_TRUE(reg.try_acquire("build", "/a").granted);
    {
        OperationLease lease(reg, "build", "/a");
        EXPECT_TRUE(lease.active());
    }
    EXPECT_EQ(reg.held_count(), 0u);
}

TEST(OperationLease, MovedLeaseReleasesOnce) {
    OperationLockRegistry reg;
    ASSERT_TRUE(reg.try_acquire("build", "/a").granted);
    OperationLease first(reg, "build", "/a");
    OperationLease second(std::move(first));
    EXPECT_FALSE(first.active());
    // Someone else takes the target after the explicit release; the
    // moved-from lease must not release it again.
    second.release();
    ASSERT_TRUE(reg.try_acquire("run", "/a").granted);
    first.release();
    second.release();
    EXPECT_EQ(reg.held_count(), 1u);
}

TEST(OperationLock, ConflictMessageNamesHolder) {
    OperationLockRegistry reg;
    reg.try_acquire("build", "/work/app");
    auto r = reg.try_acquire("publish", "/work/app");
    ASSERT_FALSE(r.granted);
    auto msg = format_conflict("publish", "/work/app", *r.holder);
    EXPECT_NE(msg.find("'publish'"), std::string::npos);
    EXPECT_NE(msg.find("build on /work/app"), std::string::npos);
    EXPECT_NE(msg.find("started at "), std::string::npos);
}
