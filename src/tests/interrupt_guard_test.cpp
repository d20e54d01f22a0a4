#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <thread>
#include "network/abort_handle.hpp"
#include "upload/interrupt_guard.hpp"
#include "test_utils.hpp"

using namespace cirrus::upload;
using cirrus::network::AbortHandle;

class InterruptGuardTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
    }

    // Signal delivery to the guard's loop is asynchronous
    template <class Predicate>
    static bool eventually(Predicate predicate) {
        for (int i = 0; i < 200; ++i) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return predicate();
    }
};

// SIGINT aborts every registered handle
TEST_F(InterruptGuardTest, InterruptAbortsRegisteredHandles) {
    auto first = std::make_shared<AbortHandle>();
    auto second = std::make_shared<AbortHandle>();
    std::atomic<int> notified{0};

    InterruptGuard guard(first, [&notified](int signal_number) {
        if (signal_number == SIGINT) {
            ++notified;
        }
    });
    guard.add(second);

    std::raise(SIGINT);

    EXPECT_TRUE(eventually([&]() { return second->aborted() && notified.load() == 1; }));
    EXPECT_TRUE(first->aborted());
    EXPECT_EQ(first->reason(), "Interrupted by signal " + std::to_string(SIGINT));
    EXPECT_TRUE(guard.interrupted());
    EXPECT_EQ(guard.last_signal(), SIGINT);
}

// Handles that never registered are left alone
TEST_F(InterruptGuardTest, UnregisteredHandleIsUnaffected) {
    auto registered = std::make_shared<AbortHandle>();
    auto bystander = std::make_shared<AbortHandle>();

    InterruptGuard guard(registered);
    std::raise(SIGTERM);

    EXPECT_TRUE(eventually([&]() { return registered->aborted(); }));
    EXPECT_FALSE(bystander->aborted());
}

// A repeated interrupt keeps being absorbed by the guard
TEST_F(InterruptGuardTest, RepeatedInterrupts) {
    auto handle = std::make_shared<AbortHandle>();
    std::atomic<int> count{0};
    InterruptGuard guard(handle, [&count](int) { ++count; });

    std::raise(SIGINT);
    EXPECT_TRUE(eventually([&]() { return count.load() == 1; }));
    std::raise(SIGINT);
    EXPECT_TRUE(eventually([&]() { return count.load() == 2; }));
    EXPECT_EQ(handle->reason(), "Interrupted by signal " + std::to_string(SIGINT));
}

// Released handles do not keep the guard from working
TEST_F(InterruptGuardTest, ExpiredHandlesAreSkipped) {
    auto kept = std::make_shared<AbortHandle>();
    InterruptGuard guard(std::make_shared<AbortHandle>());
    guard.add(kept);

    std::raise(SIGINT);
    EXPECT_TRUE(eventually([&]() { return kept->aborted(); }));
}

// Constructing and destroying a guard without signals is clean
TEST_F(InterruptGuardTest, QuietLifecycle) {
    auto handle = std::make_shared<AbortHandle>();
    {
        InterruptGuard guard(handle);
        EXPECT_FALSE(guard.interrupted());
    }
    EXPECT_FALSE(handle->aborted());
}

// A guard installed before the upload starts covers a signal that arrives
// before the upload's handle is registered
TEST_F(InterruptGuardTest, HandleAddedAfterInterrupt) {
    std::atomic<int> notified{0};
    InterruptGuard guard(nullptr, [&notified](int) { ++notified; });

    std::raise(SIGINT);
    EXPECT_TRUE(eventually([&]() { return guard.interrupted() && notified.load() == 1; }));

    auto late = std::make_shared<AbortHandle>();
    guard.add(late);
    EXPECT_TRUE(late->aborted());
    EXPECT_EQ(late->reason(), "Interrupted by signal " + std::to_string(SIGINT));
    EXPECT_NO_THROW(guard.add(nullptr));
}
