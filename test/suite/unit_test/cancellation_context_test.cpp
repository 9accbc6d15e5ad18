/* Flow-Xfer: Core
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

#include "xfer/transfer/cancellation_context.hpp"
#include "xfer/test/test_common_util.hpp"
#include "xfer/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/thread/future.hpp>
#include <boost/thread/thread.hpp>
#include <atomic>
#include <vector>

namespace xfer::transfer::test
{

namespace
{
using xfer::test::Test_logger;
using xfer::test::wait_until;
using Hook = Cancellation_context::Hook;
using boost::chrono::milliseconds;
using boost::chrono::seconds;
} // Anonymous namespace.

TEST(Cancellation_context, Hooks_fire_once_in_order)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  std::vector<int> fired;
  Error_code seen_cause;

  auto hook1 = ctx.on_cancel([&](const Error_code& cause) { fired.push_back(1); seen_cause = cause; });
  auto hook2 = ctx.on_cancel([&](const Error_code&) { fired.push_back(2); });
  EXPECT_TRUE(hook1.active());
  EXPECT_EQ(ctx.hook_count(), 2u);
  EXPECT_FALSE(ctx.canceled());
  EXPECT_FALSE(ctx.cause());

  EXPECT_TRUE(ctx.cancel());
  EXPECT_EQ(fired, (std::vector<int>{ 1, 2 }));
  EXPECT_EQ(seen_cause, error::make_error_code(error::Code::S_REQUEST_CANCELED));
  EXPECT_TRUE(ctx.canceled());
  EXPECT_EQ(ctx.hook_count(), 0u);

  // First cancel wins; later ones change nothing and fire nothing.
  EXPECT_FALSE(ctx.cancel(error::Code::S_TRANSFER_FAILED));
  EXPECT_EQ(fired.size(), 2u);
  EXPECT_EQ(ctx.cause(), error::make_error_code(error::Code::S_REQUEST_CANCELED));

  // Disposing hooks that already fired is harmless.
  hook1.dispose();
  EXPECT_FALSE(hook1.active());
}

TEST(Cancellation_context, Custom_and_falsy_cause)
{
  Test_logger logger;
  {
    Cancellation_context ctx(&logger, "custom");
    const Error_code cause = error::Code::S_TRANSFER_FAILED;
    EXPECT_TRUE(ctx.cancel(cause));
    EXPECT_EQ(ctx.cause(), cause);
  }
  {
    Cancellation_context ctx(&logger, "falsy");
    EXPECT_TRUE(ctx.cancel(Error_code()));
    EXPECT_EQ(ctx.cause(), error::make_error_code(error::Code::S_REQUEST_CANCELED));
  }
}

TEST(Cancellation_context, Disposed_hook_does_not_fire)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  int n_fired = 0;

  {
    auto hook = ctx.on_cancel([&](const Error_code&) { ++n_fired; });
    EXPECT_EQ(ctx.hook_count(), 1u);
  } // Destructor disposes.
  EXPECT_EQ(ctx.hook_count(), 0u);

  auto hook = ctx.on_cancel([&](const Error_code&) { ++n_fired; });
  hook.dispose();
  EXPECT_FALSE(hook.active());
  EXPECT_EQ(ctx.hook_count(), 0u);

  ctx.cancel();
  EXPECT_EQ(n_fired, 0);
}

TEST(Cancellation_context, Hook_moves)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  int n_fired = 0;

  Hook outer;
  EXPECT_FALSE(outer.active());
  {
    auto inner = ctx.on_cancel([&](const Error_code&) { ++n_fired; });
    outer = std::move(inner);
    EXPECT_FALSE(inner.active());
  } // Moved-from hook's destruction disposes nothing.
  EXPECT_TRUE(outer.active());
  EXPECT_EQ(ctx.hook_count(), 1u);

  Hook moved(std::move(outer));
  EXPECT_TRUE(moved.active());
  EXPECT_FALSE(outer.active());

  ctx.cancel();
  EXPECT_EQ(n_fired, 1);
}

TEST(Cancellation_context, Hook_after_cancel_fires_immediately)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  const Error_code cause = error::Code::S_TRANSFER_FAILED;
  ctx.cancel(cause);

  Error_code seen_cause;
  auto hook = ctx.on_cancel([&](const Error_code& actual_cause) { seen_cause = actual_cause; });
  EXPECT_EQ(seen_cause, cause);
  EXPECT_FALSE(hook.active());
  EXPECT_EQ(ctx.hook_count(), 0u);
}

TEST(Cancellation_context, Hook_may_reenter)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  bool saw_canceled = false;

  auto hook = ctx.on_cancel([&](const Error_code&) { saw_canceled = ctx.canceled() && (ctx.hook_count() == 0); });
  ctx.cancel();
  EXPECT_TRUE(saw_canceled);
}

TEST(Cancellation_context, Dispose_waits_for_running_hook)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  std::atomic<bool> hook_started(false);
  std::atomic<bool> hook_finished(false);
  boost::promise<void> release;
  auto released = release.get_future().share();

  auto hook = ctx.on_cancel([&](const Error_code&)
  {
    hook_started = true;
    released.wait();
    hook_finished = true;
  });

  boost::thread canceler([&]() { ctx.cancel(); });
  ASSERT_TRUE(wait_until([&]() -> bool { return hook_started; }, seconds(5)));

  std::atomic<bool> disposed(false);
  boost::thread disposer([&]()
  {
    hook.dispose();
    disposed = true;
    // Once dispose() returns the hook must be done with anything it captured.
    EXPECT_TRUE(hook_finished);
  });

  flow::util::this_thread::sleep_for(milliseconds(100));
  EXPECT_FALSE(disposed);

  release.set_value();
  disposer.join();
  canceler.join();
  EXPECT_TRUE(disposed);
  EXPECT_FALSE(hook.active());
}

TEST(Cancellation_context, Hook_disposed_during_cancel_is_skipped)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  std::atomic<bool> first_started(false);
  std::atomic<int> n_second_fired(0);
  boost::promise<void> release;
  auto released = release.get_future().share();

  auto hook1 = ctx.on_cancel([&](const Error_code&)
  {
    first_started = true;
    released.wait();
  });
  auto hook2 = ctx.on_cancel([&](const Error_code&) { ++n_second_fired; });

  boost::thread canceler([&]() { ctx.cancel(); });
  ASSERT_TRUE(wait_until([&]() -> bool { return first_started; }, seconds(5)));

  // hook2 has not started; disposing it does not wait, and it will never run.
  hook2.dispose();
  EXPECT_EQ(ctx.hook_count(), 0u);

  release.set_value();
  canceler.join();
  EXPECT_EQ(n_second_fired.load(), 0);
  EXPECT_TRUE(ctx.canceled());
}

TEST(Cancellation_context, Hook_may_dispose_itself)
{
  Test_logger logger;
  Cancellation_context ctx(&logger, "ctx");
  int n_fired = 0;

  Hook hook;
  hook = ctx.on_cancel([&](const Error_code&)
  {
    ++n_fired;
    hook.dispose(); // Must not wait for itself.
  });
  EXPECT_TRUE(ctx.cancel());
  EXPECT_EQ(n_fired, 1);
  EXPECT_FALSE(hook.active());
}

} // namespace xfer::transfer::test
