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

/// @file
#pragma once

#include "xfer/transfer/transfer_fwd.hpp"
#include "xfer/transfer/completion_record.hpp"
#include "xfer/transfer/error.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/error/error.hpp>
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <boost/unordered_map.hpp>
#include <exception>
#include <vector>

namespace xfer::transfer
{

// Types.

/**
 * The one thread (thread W) that owns a native transfer engine (see `Transfer_engine` concept) and through which
 * every call into that engine is made.  Other threads ("callers") *dispatch* operations to it: schedule(),
 * poll_completed_batch() and shutdown() block the calling thread until thread W has carried them out and return the
 * result; cancel() merely enqueues.  Dispatched operations execute one at a time, in the order they are enqueued.
 *
 * The engine is created, used, closed and destroyed in thread W only; so it needs no thread safety of its own.
 *
 * ### Life cycle ###
 * The ctor starts thread W and, in it, creates the engine via the given factory; it returns once that is done.
 * If the factory fails, the worker is born not-running.  Otherwise it is running until shutdown(), which closes and
 * destroys the engine and then stops thread W.  While not running, every dispatch fails with
 * error::Code::S_WORKER_UNAVAILABLE (and cancel() does nothing) -- immediately, never hanging.
 *
 * @internal
 * ### Implementation ###
 * Thread W is a `flow::async::Single_thread_task_loop`.  A blocking dispatch is a `post()` in mode
 * `Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION`, the results being written by the task into locals of
 * the dispatching frame.  Such a post would wait forever if the loop were stopped concurrently; hence #m_running is
 * guarded by the reader/writer mutex #m_lifecycle_mutex: dispatches check it, and post, under the shared lock;
 * shutdown() flips it, and drains thread W, under the exclusive lock.  So a dispatch either completes before
 * shutdown() proceeds or observes not-running; and many dispatches can still be in progress at once (queued in
 * thread W).
 *
 * The engine may hand a finished transfer's handle value to a later transfer.  So callers never cancel by handle:
 * thread W keeps #m_handles (request identity => handle) for exactly the transfers the engine has not yet reported,
 * and a cancel whose request is no longer there is dropped before reaching the engine.
 *
 * @tparam Transfer_engine_t
 *         Type satisfying the `Transfer_engine` concept.
 */
template<typename Transfer_engine_t>
class Transfer_worker :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Transfer_engine = Transfer_engine_t;

  /// Short-hand for the engine's transfer handle type.
  using Handle = typename Transfer_engine::Handle;

  /// The engine as owned by `*this`.
  using Engine_ptr = boost::movelib::unique_ptr<Transfer_engine>;

  /**
   * Creates the engine; invoked once, in thread W.  Return null (or throw) to indicate the engine could not be
   * created; the reason should be logged by the factory.
   */
  using Engine_factory = Function<Engine_ptr ()>;

  // Constructors/destructor.

  /**
   * Starts thread W and creates the engine in it; returns once the engine exists or failed to be created.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname_str
   *        Human-readable name; also used (possibly truncated) as thread W's OS name.
   * @param engine_factory
   *        See #Engine_factory.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_ENGINE_INIT_FAILED (`*this` is usable but not running).
   */
  explicit Transfer_worker(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                           Engine_factory&& engine_factory, Error_code* err_code = 0);

  /// Performs shutdown() if not yet done (logging any error).
  ~Transfer_worker();

  // Methods.

  /**
   * Dispatches `engine.schedule_request(request)`; returns its result.
   *
   * @param request
   *        The request; copied into thread W.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WORKER_UNAVAILABLE; or whatever the engine reports.
   * @return Handle to the scheduled transfer; meaningless on error.
   */
  Handle schedule(const Request_descriptor& request, Error_code* err_code = 0);

  /**
   * Dispatches `engine.poll_completed(timeout)`; returns its result.  Blocks for up to about `timeout` beyond the
   * time it takes for previously dispatched operations to execute.
   *
   * @param timeout
   *        Maximum time to block inside the engine when nothing is ready.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WORKER_UNAVAILABLE.
   * @return Completion records; possibly empty.
   */
  std::vector<Completion_record> poll_completed_batch(util::Fine_duration timeout, Error_code* err_code = 0);

  /**
   * Enqueues `engine.cancel_request()` of the transfer scheduled for the given request and returns without waiting
   * for it.  If, by the time thread W gets to it, that transfer has already been reported by a poll (or was never
   * scheduled), nothing reaches the engine.
   *
   * @param request_id
   *        `Request_descriptor::id()` of a request given to schedule().
   * @param cause
   *        Cause the engine shall report for the transfer.
   * @return `true` if enqueued; `false` if not running (nothing happens).
   */
  bool cancel(request_id_t request_id, const Error_code& cause);

  /**
   * Closes and destroys the engine (in thread W), then stops thread W.  Dispatches already in progress complete
   * first; later ones fail with error::Code::S_WORKER_UNAVAILABLE.  If engine close reports an error, shutdown
   * still completes, and the error is emitted.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WORKER_UNAVAILABLE (already not running; no-op); or whatever engine close reports.
   */
  void shutdown(Error_code* err_code = 0);

  /**
   * Whether the worker is running, i.e., it has an engine and shutdown() has not been called.
   * @return See above.
   */
  bool running() const;

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Guards #m_running; see Implementation section of class doc header.
  mutable util::Mutex_shared_non_recursive m_lifecycle_mutex;

  /// See running().  Protected by #m_lifecycle_mutex.
  bool m_running;

  /// Thread W.
  flow::async::Single_thread_task_loop m_worker;

  /// The engine; touched only in thread W.  Null before creation, after failed creation and after shutdown.
  Engine_ptr m_engine;

  /// Request identity => handle, for each transfer scheduled but not yet returned by a poll.  Thread W only.
  boost::unordered_map<request_id_t, Handle> m_handles;
}; // class Transfer_worker

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_TRANSFER_WORKER \
  template<typename Transfer_engine_t>
/// Internally used macro; public API users should disregard.
#define CLASS_TRANSFER_WORKER \
  Transfer_worker<Transfer_engine_t>

TEMPLATE_TRANSFER_WORKER
CLASS_TRANSFER_WORKER::Transfer_worker(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                       Engine_factory&& engine_factory, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_nickname(nickname_str),
  m_running(false),
  // (Linux) OS thread name will truncate to 15 chars; the nickname's start should be the useful part.
  m_worker(get_logger(), flow::util::ostream_op_string("XW-", m_nickname))
{
  using flow::error::Runtime_error;
  using flow::async::reset_thread_pinning;
  using std::exception;

  bool created = false;

  FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Awaiting engine creation in worker thread.");
  m_worker.start([&]() // Execute all this synchronously in the thread.
  {
    reset_thread_pinning(get_logger()); // Don't inherit any strange core-affinity!  Worker must float free.

    FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Starting (am in worker thread).  Creating engine.");

    try
    {
      m_engine = engine_factory();
    }
    catch (const exception& exc)
    {
      assert(!m_engine);
      FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Engine factory threw: [" << exc.what() << "].");
    }
    catch (...)
    {
      // Reported below as S_ENGINE_INIT_FAILED, like any other creation failure.
      assert(!m_engine);
      FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Engine factory threw a non-std::exception.");
    }

    created = bool(m_engine);
  }); // m_worker.start()

  if (!created)
  {
    FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Engine could not be created.  Stopping worker thread; "
                     "every operation will fail.");
    m_worker.stop();

    if (err_code)
    {
      *err_code = error::Code::S_ENGINE_INIT_FAILED;
      return;
    }
    // else
    throw Runtime_error(error::Code::S_ENGINE_INIT_FAILED, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  m_running = true; // Nobody else can see us yet; no need to lock.
  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Engine created.  Ready.");
} // Transfer_worker::Transfer_worker()

TEMPLATE_TRANSFER_WORKER
CLASS_TRANSFER_WORKER::~Transfer_worker()
{
  if (running())
  {
    FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Shutting down (was not explicitly shut down).");
    Error_code err_code;
    shutdown(&err_code); // It logged on error.
  }
  // else: Thread W already stopped (or was never usable).
}

TEMPLATE_TRANSFER_WORKER
typename CLASS_TRANSFER_WORKER::Handle
  CLASS_TRANSFER_WORKER::schedule(const Request_descriptor& request, Error_code* err_code)
{
  using flow::async::Synchronicity;

  Handle handle;
  if (flow::error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Handle
                                             { return schedule(request, actual_err_code); },
                                           &handle, err_code, "Transfer_worker::schedule()"))
  {
    return handle;
  }
  // else if (err_code): Proceed.

  util::Lock_guard_shared_non_recursive_sh lifecycle_lock(m_lifecycle_mutex);
  if (!m_running)
  {
    FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Cannot schedule [" << request << "]: not running.");
    *err_code = error::Code::S_WORKER_UNAVAILABLE;
    return handle;
  }
  // else

  Error_code engine_err_code;
  m_worker.post([&, request]() // Copy the request into thread W.
  {
    // We are in thread W.
    handle = m_engine->schedule_request(request, &engine_err_code);
    if (!engine_err_code)
    {
      m_handles[request.id()] = handle;
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  if (engine_err_code)
  {
    FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Engine could not schedule [" << request << "]: "
                     "[" << engine_err_code << "] [" << engine_err_code.message() << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Scheduled [" << request << "] => handle [" << handle << "].");
  }
  *err_code = engine_err_code;
  return handle;
} // Transfer_worker::schedule()

TEMPLATE_TRANSFER_WORKER
std::vector<Completion_record>
  CLASS_TRANSFER_WORKER::poll_completed_batch(util::Fine_duration timeout, Error_code* err_code)
{
  using flow::async::Synchronicity;
  using std::vector;

  vector<Completion_record> batch;
  if (flow::error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> vector<Completion_record>
                                             { return poll_completed_batch(timeout, actual_err_code); },
                                           &batch, err_code, "Transfer_worker::poll_completed_batch()"))
  {
    return batch;
  }
  // else if (err_code): Proceed.

  util::Lock_guard_shared_non_recursive_sh lifecycle_lock(m_lifecycle_mutex);
  if (!m_running)
  {
    FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Cannot poll: not running.");
    *err_code = error::Code::S_WORKER_UNAVAILABLE;
    return batch;
  }
  // else

  m_worker.post([&]()
  {
    // We are in thread W.
    batch = m_engine->poll_completed(timeout);
    for (const auto& record : batch)
    {
      m_handles.erase(record.request().id()); // Its handle may now be reused by the engine.
    }
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  FLOW_LOG_DATA("Transfer_worker [" << *this << "]: Poll yielded [" << batch.size() << "] completions.");
  err_code->clear();
  return batch;
} // Transfer_worker::poll_completed_batch()

TEMPLATE_TRANSFER_WORKER
bool CLASS_TRANSFER_WORKER::cancel(request_id_t request_id, const Error_code& cause)
{
  util::Lock_guard_shared_non_recursive_sh lifecycle_lock(m_lifecycle_mutex);
  if (!m_running)
  {
    FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Cannot cancel request ID [" << request_id << "]: "
                  "not running.  Ignoring.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Enqueuing cancel of request ID [" << request_id << "] "
                 "with cause [" << cause << "].");
  m_worker.post([this, request_id, cause]()
  {
    // We are in thread W.  shutdown() drains the queue before destroying the engine; so it's still here.
    const auto it = m_handles.find(request_id);
    if (it == m_handles.end())
    {
      FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Request ID [" << request_id << "] already reported "
                     "(or never scheduled); not canceling.");
      return;
    }
    // else

    FLOW_LOG_TRACE("Transfer_worker [" << *this << "]: Canceling request ID [" << request_id << "] => "
                   "handle [" << it->second << "].");
    m_engine->cancel_request(it->second, cause);
  });
  return true;
} // Transfer_worker::cancel()

TEMPLATE_TRANSFER_WORKER
void CLASS_TRANSFER_WORKER::shutdown(Error_code* err_code)
{
  using flow::async::Synchronicity;

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { shutdown(actual_err_code); },
         err_code, "Transfer_worker::shutdown()"))
  {
    return;
  }
  // else if (err_code): Proceed.

  util::Lock_guard_shared_non_recursive_ex lifecycle_lock(m_lifecycle_mutex);
  if (!m_running)
  {
    FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Shutdown requested, but not running.  Ignoring.");
    *err_code = error::Code::S_WORKER_UNAVAILABLE;
    return;
  }
  // else
  m_running = false;

  FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Shutting down.  Closing engine in worker thread once "
                "already-enqueued operations complete.");

  Error_code close_err_code;
  m_worker.post([&]()
  {
    // We are in thread W.  Anything enqueued before us (e.g., cancels) has run.
    m_engine->close(&close_err_code);
    m_engine.reset();
    m_handles.clear();
  }, Synchronicity::S_ASYNC_AND_AWAIT_CONCURRENT_COMPLETION);

  if (close_err_code)
  {
    FLOW_LOG_WARNING("Transfer_worker [" << *this << "]: Engine close reported error "
                     "[" << close_err_code << "] [" << close_err_code.message() << "].  Stopping thread anyway.");
  }

  m_worker.stop();
  FLOW_LOG_INFO("Transfer_worker [" << *this << "]: Worker thread stopped.");

  *err_code = close_err_code;
} // Transfer_worker::shutdown()

TEMPLATE_TRANSFER_WORKER
bool CLASS_TRANSFER_WORKER::running() const
{
  util::Lock_guard_shared_non_recursive_sh lifecycle_lock(m_lifecycle_mutex);
  return m_running;
}

TEMPLATE_TRANSFER_WORKER
const std::string& CLASS_TRANSFER_WORKER::nickname() const
{
  return m_nickname;
}

TEMPLATE_TRANSFER_WORKER
std::ostream& operator<<(std::ostream& os, const CLASS_TRANSFER_WORKER& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

#undef CLASS_TRANSFER_WORKER
#undef TEMPLATE_TRANSFER_WORKER

} // namespace xfer::transfer
