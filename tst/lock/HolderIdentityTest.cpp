// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>
#include <sstream>
#include <thread>
#include "lock/HolderIdentity.hpp"
#include "common/Util.hpp"

using dlock::HolderIdentity;

TEST(HolderIdentityTest, EqualityComparesBothParts) {
    const HolderIdentity a {"10.0.0.1", 7};
    EXPECT_EQ(a, (HolderIdentity {"10.0.0.1", 7}));
    EXPECT_NE(a, (HolderIdentity {"10.0.0.2", 7}));
    EXPECT_NE(a, (HolderIdentity {"10.0.0.1", 8}));
}

TEST(HolderIdentityTest, Formatting) {
    const HolderIdentity a {"10.0.0.1", 7};
    EXPECT_EQ(a.toString(), "10.0.0.1:7");
    std::ostringstream os;
    os << a;
    EXPECT_EQ(os.str(), "10.0.0.1:7");
}

TEST(HolderIdentityTest, CurrentIsPerThread) {
    const auto here = HolderIdentity::current();
    EXPECT_FALSE(here.networkAddress.empty());
    EXPECT_EQ(here, HolderIdentity::current());
    EXPECT_EQ(here.taskId, dlock_current_task_id());
    HolderIdentity there {"", 0};
    std::thread t([&there]() { there = HolderIdentity::current(); });
    t.join();
    EXPECT_EQ(there.networkAddress, here.networkAddress);
    EXPECT_NE(there.taskId, here.taskId);
}
