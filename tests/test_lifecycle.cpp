#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <vector>
#include "../include/Lifecycle.hpp"

using namespace devops;
using namespace std::chrono_literals;

namespace
{
    std::atomic<int> previous_hits{0};

    void previous_handler(int) { ++previous_hits; }

    // Installs previous_handler for the test's lifetime.
    struct HandlerGuard
    {
        struct sigaction saved_int{};
        struct sigaction saved_term{};

        HandlerGuard()
        {
            struct sigaction action{};
            action.sa_handler = previous_handler;
            sigemptyset(&action.sa_mask);
            sigaction(SIGINT, &action, &saved_int);
            sigaction(SIGTERM, &action, &saved_term);
        }

        ~HandlerGuard()
        {
            sigaction(SIGINT, &saved_int, nullptr);
            sigaction(SIGTERM, &saved_term, nullptr);
        }
    };
} // namespace

TEST(Lifecycle, StartsUncancelled)
{
    const HandlerGuard guard;
    const LifecycleController lifecycle(Context::background());
    EXPECT_FALSE(lifecycle.context().done());
    EXPECT_EQ(lifecycle.signal_received(), 0);
}

TEST(Lifecycle, SigtermCancelsTheContext)
{
    const HandlerGuard guard;
    const LifecycleController lifecycle(Context::background());
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(lifecycle.context().wait_for(2s));
    EXPECT_EQ(lifecycle.context().reason(), CancelReason::cancelled);
    EXPECT_EQ(lifecycle.signal_received(), SIGTERM);
}

TEST(Lifecycle, SigintCancelsTheContext)
{
    const HandlerGuard guard;
    const LifecycleController lifecycle(Context::background());
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_TRUE(lifecycle.context().wait_for(2s));
    EXPECT_EQ(lifecycle.signal_received(), SIGINT);
}

TEST(Lifecycle, DerivedContextsSeeTheCancellation)
{
    const HandlerGuard guard;
    const LifecycleController lifecycle(Context::background());
    const auto step = Context::with_timeout(lifecycle.context(), 1h);
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(step.wait_for(2s));
}

TEST(Lifecycle, BaseCancellationPropagates)
{
    const HandlerGuard guard;
    const auto base = Context::with_cancel(Context::background());
    const LifecycleController lifecycle(base);
    base.cancel();
    EXPECT_TRUE(lifecycle.context().done());
    EXPECT_EQ(lifecycle.signal_received(), 0);
}

TEST(Lifecycle, RestoresPreviousHandlers)
{
    const HandlerGuard guard;
    {
        const LifecycleController lifecycle(Context::background());
        struct sigaction current{};
        sigaction(SIGTERM, nullptr, &current);
        EXPECT_NE(current.sa_handler, previous_handler);
    }
    struct sigaction current{};
    sigaction(SIGTERM, nullptr, &current);
    EXPECT_EQ(current.sa_handler, previous_handler);

    const int before = previous_hits.load();
    ASSERT_EQ(std::raise(SIGINT), 0);
    EXPECT_EQ(previous_hits.load(), before + 1);
}

TEST(Lifecycle, OnlyOneControllerAtATime)
{
    const HandlerGuard guard;
    {
        const LifecycleController first(Context::background());
        EXPECT_THROW(LifecycleController second(Context::background()), std::runtime_error);
    }
    EXPECT_NO_THROW(LifecycleController again(Context::background()));
}

TEST(Lifecycle, FailedInstallRollsBack)
{
    const HandlerGuard guard;
    // SIGKILL cannot be caught, so the second install fails after SIGINT succeeded.
    const std::vector<int> signals = {SIGINT, SIGKILL};
    EXPECT_THROW(LifecycleController broken(Context::background(), signals), std::runtime_error);

    struct sigaction current{};
    sigaction(SIGINT, nullptr, &current);
    EXPECT_EQ(current.sa_handler, previous_handler);
    sigaction(SIGTERM, nullptr, &current);
    EXPECT_EQ(current.sa_handler, previous_handler);

    EXPECT_NO_THROW(LifecycleController again(Context::background()));
}

TEST(Lifecycle, CustomSignalList)
{
    const HandlerGuard guard;
    const LifecycleController lifecycle(Context::background(), {SIGTERM});
    struct sigaction current{};
    sigaction(SIGINT, nullptr, &current);
    EXPECT_EQ(current.sa_handler, previous_handler);
    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(lifecycle.context().wait_for(2s));
    EXPECT_EQ(lifecycle.signal_received(), SIGTERM);
}
