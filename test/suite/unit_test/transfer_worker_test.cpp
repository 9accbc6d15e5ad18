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

#include "xfer/transfer/transfer_worker.hpp"
#include "xfer/test/scripted_transfer_engine.hpp"
#include "xfer/test/test_common_util.hpp"
#include "xfer/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <boost/asio/error.hpp>
#include <boost/make_shared.hpp>
#include <stdexcept>

namespace xfer::transfer::test
{

namespace
{
using xfer::test::Scripted_transfer_engine;
using xfer::test::Test_logger;
using xfer::test::make_success;
using Worker = Transfer_worker<Scripted_transfer_engine>;
using Script = Scripted_transfer_engine::Script;
using boost::chrono::milliseconds;

const util::Fine_duration S_POLL_TIMEOUT = milliseconds(500);
} // Anonymous namespace.

TEST(Transfer_worker, Engine_confined_to_worker_thread)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  {
    Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script));
    EXPECT_TRUE(worker.running());
    EXPECT_TRUE(script->engine_alive());
    EXPECT_NE(script->engine_thread_id(), boost::thread::id());
    EXPECT_NE(script->engine_thread_id(), boost::this_thread::get_id());

    const Request_descriptor req("GET", "http://example.com/");
    worker.schedule(req);
    ASSERT_EQ(script->scheduled().size(), 1u);
    EXPECT_EQ(script->scheduled().front(), req);

    script->complete(make_success(req, 200, "ok"));
    auto batch = worker.poll_completed_batch(S_POLL_TIMEOUT);
    ASSERT_EQ(batch.size(), 1u);
    EXPECT_EQ(batch.front().request(), req);
    EXPECT_TRUE(batch.front().succeeded());

    // Nothing more: the poll times out empty.
    EXPECT_TRUE(worker.poll_completed_batch(milliseconds(10)).empty());

    // Cancel of a transfer already reported: accepted, but it never reaches the engine.
    EXPECT_TRUE(worker.cancel(req.id(), error::Code::S_REQUEST_CANCELED));
    worker.shutdown();
    EXPECT_EQ(script->n_late_cancels(), 0u);
    EXPECT_EQ(script->n_effective_cancels(), 0u);
  } // Destructor: already shut down; nothing happens.

  EXPECT_FALSE(script->engine_alive());
  EXPECT_EQ(script->n_closes(), 1u);
  EXPECT_TRUE(script->violation().empty()) << script->violation();
}

TEST(Transfer_worker, Operations_after_shutdown)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script));

  Error_code err_code;
  worker.shutdown(&err_code);
  EXPECT_FALSE(err_code);
  EXPECT_FALSE(worker.running());
  EXPECT_FALSE(script->engine_alive());

  worker.shutdown(&err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_WORKER_UNAVAILABLE));

  const Request_descriptor req("GET", "http://example.com/");
  worker.schedule(req, &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_WORKER_UNAVAILABLE));
  EXPECT_THROW(worker.schedule(req), flow::error::Runtime_error);

  const auto batch = worker.poll_completed_batch(milliseconds(10), &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_WORKER_UNAVAILABLE));
  EXPECT_TRUE(batch.empty());

  EXPECT_FALSE(worker.cancel(req.id(), error::Code::S_REQUEST_CANCELED));

  EXPECT_EQ(script->n_closes(), 1u);
  EXPECT_TRUE(script->scheduled().empty());
  EXPECT_TRUE(script->violation().empty()) << script->violation();
}

TEST(Transfer_worker, Cancel_in_flight)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script));

  const Request_descriptor req("GET", "http://example.com/slow");
  worker.schedule(req);
  EXPECT_TRUE(worker.cancel(req.id(), error::Code::S_REQUEST_CANCELED));

  // The cancel was enqueued before the poll; so the poll sees its result.
  const auto batch = worker.poll_completed_batch(S_POLL_TIMEOUT);
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_FALSE(batch.front().succeeded());
  EXPECT_EQ(batch.front().cause(), error::make_error_code(error::Code::S_REQUEST_CANCELED));
  EXPECT_EQ(script->n_effective_cancels(), 1u);

  // Again: now it has been reported, so the worker drops it.  Shutdown runs after the queued cancel.
  EXPECT_TRUE(worker.cancel(req.id(), error::Code::S_REQUEST_CANCELED));
  worker.shutdown();
  EXPECT_EQ(script->n_late_cancels(), 0u);
  EXPECT_EQ(script->n_effective_cancels(), 1u);
  EXPECT_TRUE(script->violation().empty()) << script->violation();
}

TEST(Transfer_worker, Cancel_after_handle_reuse)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  script->set_reuse_handles(true);
  Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script));

  const Request_descriptor req1("GET", "http://example.com/first");
  const auto handle1 = worker.schedule(req1);
  script->complete(make_success(req1, 200, "first"));
  auto batch = worker.poll_completed_batch(S_POLL_TIMEOUT);
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch.front().request(), req1);

  // The engine hands the freed handle to the next transfer.
  const Request_descriptor req2("GET", "http://example.com/second");
  const auto handle2 = worker.schedule(req2);
  EXPECT_EQ(handle2, handle1);
  EXPECT_EQ(script->n_reused_handles(), 1u);

  // A stale cancel of the first request must not abort the second.
  EXPECT_TRUE(worker.cancel(req1.id(), error::Code::S_REQUEST_CANCELED));
  EXPECT_TRUE(worker.poll_completed_batch(milliseconds(50)).empty());
  EXPECT_EQ(script->n_effective_cancels(), 0u);

  script->complete(make_success(req2, 200, "second"));
  batch = worker.poll_completed_batch(S_POLL_TIMEOUT);
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch.front().request(), req2);
  ASSERT_TRUE(batch.front().succeeded());
  EXPECT_EQ(batch.front().response().m_body, "second");

  // Canceling the second by its own identity still works while it is live.
  const Request_descriptor req3("GET", "http://example.com/third");
  worker.schedule(req3);
  EXPECT_TRUE(worker.cancel(req3.id(), error::Code::S_REQUEST_CANCELED));
  batch = worker.poll_completed_batch(S_POLL_TIMEOUT);
  ASSERT_EQ(batch.size(), 1u);
  EXPECT_EQ(batch.front().request(), req3);
  EXPECT_FALSE(batch.front().succeeded());
  EXPECT_EQ(script->n_effective_cancels(), 1u);
  EXPECT_EQ(script->n_late_cancels(), 0u);
  EXPECT_TRUE(script->violation().empty()) << script->violation();
}

TEST(Transfer_worker, Engine_errors_propagate)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script));

  const Error_code refused = boost::asio::error::connection_refused;
  script->fail_next_schedule(refused);
  Error_code err_code;
  worker.schedule(Request_descriptor("GET", "http://127.0.0.1:1/"), &err_code);
  EXPECT_EQ(err_code, refused);

  // Only the next one failed.
  worker.schedule(Request_descriptor("GET", "http://127.0.0.1:2/"), &err_code);
  EXPECT_FALSE(err_code);

  // Close error is reported; the worker stops regardless.
  const Error_code close_err_code = error::Code::S_TRANSFER_FAILED;
  script->set_close_error(close_err_code);
  worker.shutdown(&err_code);
  EXPECT_EQ(err_code, close_err_code);
  EXPECT_FALSE(worker.running());
  EXPECT_FALSE(script->engine_alive());
}

TEST(Transfer_worker, Engine_creation_failure)
{
  Test_logger logger;
  const auto script = boost::make_shared<Script>();
  script->set_fail_creation(true);

  Error_code err_code;
  Worker worker(&logger, "w", Scripted_transfer_engine::factory(&logger, script), &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_ENGINE_INIT_FAILED));
  EXPECT_FALSE(worker.running());

  worker.schedule(Request_descriptor("GET", "http://example.com/"), &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_WORKER_UNAVAILABLE));

  EXPECT_THROW({ Worker worker2(&logger, "w2", Scripted_transfer_engine::factory(&logger, script)); },
               flow::error::Runtime_error);

  // A throwing factory is the same as a failing one.
  Worker throwing_worker(&logger, "w3",
                         []() -> Worker::Engine_ptr { throw std::runtime_error("cannot init engine"); },
                         &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_ENGINE_INIT_FAILED));
  EXPECT_FALSE(throwing_worker.running());

  // So is one throwing something other than a std::exception.
  Worker odd_worker(&logger, "w4", []() -> Worker::Engine_ptr { throw 42; }, &err_code);
  EXPECT_EQ(err_code, error::make_error_code(error::Code::S_ENGINE_INIT_FAILED));
  EXPECT_FALSE(odd_worker.running());
  EXPECT_FALSE(script->engine_alive());
}

} // namespace xfer::transfer::test
