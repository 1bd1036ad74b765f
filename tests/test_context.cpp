#include <gtest/gtest.h>

#include "api/context.hpp"
#include "api/error.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace api;
using namespace std::chrono_literals;

TEST(ContextTest, BackgroundIsNeverDone) {
    auto bg = Context::Background();
    EXPECT_FALSE(bg->Done());
    EXPECT_FALSE(bg->Err());
    EXPECT_FALSE(bg->Deadline().has_value());
    EXPECT_EQ(bg, Context::Background());
    EXPECT_FALSE(bg->WaitFor(10ms));
}

TEST(ContextTest, CancelMarksDone) {
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    EXPECT_FALSE(ctx->Done());

    cancel();
    EXPECT_TRUE(ctx->Done());
    EXPECT_EQ(ctx->Err(), context_errc::canceled);
    EXPECT_EQ(ctx->Err().message(), "context canceled");

    // Second call is a no-op.
    cancel();
    EXPECT_EQ(ctx->Err(), context_errc::canceled);
}

TEST(ContextTest, NullParentMeansBackground) {
    auto [ctx, cancel] = Context::WithCancel(nullptr);
    EXPECT_FALSE(ctx->Done());
    cancel();
    EXPECT_TRUE(ctx->Done());
}

TEST(ContextTest, ParentCancellationPropagates) {
    auto [parent, cancel_parent] = Context::WithCancel(Context::Background());
    auto [child, cancel_child] = Context::WithCancel(parent);
    auto [grandchild, cancel_grandchild] = Context::WithCancel(child);

    cancel_parent();
    EXPECT_EQ(child->Err(), context_errc::canceled);
    EXPECT_EQ(grandchild->Err(), context_errc::canceled);
}

TEST(ContextTest, ChildCancellationLeavesParentAlone) {
    auto [parent, cancel_parent] = Context::WithCancel(Context::Background());
    auto [child, cancel_child] = Context::WithCancel(parent);

    cancel_child();
    EXPECT_TRUE(child->Done());
    EXPECT_FALSE(parent->Done());
}

TEST(ContextTest, ChildOfCancelledParentStartsCancelled) {
    auto [parent, cancel_parent] = Context::WithCancel(Context::Background());
    cancel_parent();

    auto [child, cancel_child] = Context::WithCancel(parent);
    EXPECT_EQ(child->Err(), context_errc::canceled);
}

TEST(ContextTest, TimeoutExpires) {
    auto [ctx, cancel] = Context::WithTimeout(Context::Background(), 30ms);
    ASSERT_TRUE(ctx->Deadline().has_value());
    EXPECT_FALSE(ctx->Done());

    ctx->Wait();
    EXPECT_EQ(ctx->Err(), context_errc::deadline_exceeded);

    // Cancelling afterwards does not change the reason.
    cancel();
    EXPECT_EQ(ctx->Err(), context_errc::deadline_exceeded);
}

TEST(ContextTest, EarlierParentDeadlineWins) {
    auto [parent, cancel_parent] = Context::WithTimeout(Context::Background(), 50ms);
    auto [child, cancel_child] = Context::WithTimeout(parent, 10s);

    ASSERT_TRUE(child->Deadline().has_value());
    EXPECT_EQ(*child->Deadline(), *parent->Deadline());

    auto [inner, cancel_inner] = Context::WithTimeout(parent, 5ms);
    EXPECT_LT(*inner->Deadline(), *parent->Deadline());
}

TEST(ContextTest, WaitForReturnsOnCancel) {
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    std::thread canceller([cancel = cancel] {
        std::this_thread::sleep_for(20ms);
        cancel();
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx->WaitFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST(ContextTest, SubscribersRunOnceOnCancel) {
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    std::atomic<int> fired{0};
    ctx->Subscribe([&] { ++fired; });

    cancel();
    cancel();
    EXPECT_EQ(fired, 1);
}

TEST(ContextTest, SubscribeAfterCancelRunsImmediately) {
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    cancel();

    bool fired = false;
    EXPECT_EQ(ctx->Subscribe([&] { fired = true; }), 0u);
    EXPECT_TRUE(fired);
}

TEST(ContextTest, UnsubscribedCallbackDoesNotRun) {
    auto [ctx, cancel] = Context::WithCancel(Context::Background());
    bool fired = false;
    auto id = ctx->Subscribe([&] { fired = true; });
    ctx->Unsubscribe(id);

    cancel();
    EXPECT_FALSE(fired);
}

TEST(ContextTest, SubscribersSeeParentCancellation) {
    auto [parent, cancel_parent] = Context::WithCancel(Context::Background());
    auto [child, cancel_child] = Context::WithCancel(parent);
    std::atomic<int> fired{0};
    child->Subscribe([&] { ++fired; });

    cancel_parent();
    EXPECT_EQ(fired, 1);
}

TEST(ContextTest, DestroyedChildIsDetachedFromParent) {
    auto [parent, cancel_parent] = Context::WithCancel(Context::Background());
    {
        auto [child, cancel_child] = Context::WithCancel(parent);
        (void)child;
    }
    // Would touch a dead child if the subscription had been left behind.
    cancel_parent();
    EXPECT_TRUE(parent->Done());
}
