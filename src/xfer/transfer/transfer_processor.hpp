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

#include "xfer/transfer/transfer_worker.hpp"
#include "xfer/transfer/processor_config.hpp"
#include "xfer/transfer/cancellation_context.hpp"
#include "xfer/transfer/detail/pending_result_registry.hpp"
#include <boost/move/make_unique.hpp>

namespace xfer::transfer
{

// Types.

/**
 * Performs network transfers, through a native transfer engine (see `Transfer_engine` concept), on behalf of any
 * number of concurrently calling threads.  This is the main entry point of Flow-Xfer.
 *
 * ### How to use ###
 * Construct it with a factory for the engine (invoked once, in the processor's worker thread) and optionally
 * a Processor_config.  Then, from any thread(s), call execute_request(): it blocks until the transfer finishes and
 * returns the Response_data or emits the failure cause.  To abort a transfer, pass a Cancellation_context and
 * cancel() it (from any thread); the pending execute_request() then promptly reports the cancellation cause
 * (or, if the transfer finished first anyway, its actual outcome).  Finally close() -- or destroy -- the processor.
 *
 * Each execute_request() yields exactly one outcome, no matter how cancellation and close() race with the transfer.
 * Once close() has begun, any execute_request() still waiting fails with error::Code::S_WORKER_UNAVAILABLE, as
 * does any later one.
 *
 * ### Internals ###
 * The engine lives in a Transfer_worker (thread W).  execute_request() registers the request in a
 * detail::Pending_result_registry, dispatches the schedule to thread W, and then -- until its own result slot is
 * resolved -- repeatedly dispatches a poll (bounded by Processor_config::m_poll_interval) and resolves *every*
 * record in the returned batch, whichever caller it belongs to.  There is no dedicated completion-reaping thread:
 * the waiting callers themselves drive the engine forward.
 *
 * ### Thread safety ###
 * execute_request(), active_requests() and running() are safe to call concurrently with each other and with
 * close().  The destructor must not run concurrently with anything else.
 *
 * @tparam Transfer_engine_t
 *         Type satisfying the `Transfer_engine` concept.
 */
template<typename Transfer_engine_t>
class Transfer_processor :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Transfer_engine = Transfer_engine_t;

  /// The worker type.
  using Worker = Transfer_worker<Transfer_engine>;

  /// Short-hand for the engine factory type; see Transfer_worker::Engine_factory.
  using Engine_factory = typename Worker::Engine_factory;

  /// Short-hand for the engine's transfer handle type.
  using Handle = typename Worker::Handle;

  // Constructors/destructor.

  /**
   * Validates the config, starts the worker thread and creates the engine in it.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param engine_factory
   *        Creates the engine; see Transfer_worker::Engine_factory.
   * @param config
   *        Tunables.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_ARGUMENT (bad `config`), error::Code::S_ENGINE_INIT_FAILED.
   *        On error `*this` is usable, but every execute_request() fails with error::Code::S_WORKER_UNAVAILABLE.
   */
  explicit Transfer_processor(flow::log::Logger* logger_ptr, Engine_factory&& engine_factory,
                              const Processor_config& config = Processor_config(), Error_code* err_code = 0);

  /// Performs close() if not yet done (logging any error).
  ~Transfer_processor();

  // Methods.

  /**
   * Performs the given transfer, blocking until its one outcome is known.
   *
   * @param request
   *        The request.  No request with the same identity (see Request_descriptor) may be in flight.
   * @param cancel_ctx
   *        If not null, canceling it aborts the transfer.  Must outlive this call.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_DUPLICATE_REQUEST (nothing happened), error::Code::S_WORKER_UNAVAILABLE (closed or
   *        never properly opened), the `cancel_ctx` cancellation cause (typically error::Code::S_REQUEST_CANCELED),
   *        or any transfer failure reported by the engine (e.g., `boost::asio::error::connection_refused`).
   * @return The response on success; default-constructed otherwise.
   */
  Response_data execute_request(const Request_descriptor& request, Cancellation_context* cancel_ctx = 0,
                                Error_code* err_code = 0);

  /**
   * Closes the engine and stops the worker thread.  Waits for every poll already dispatched to the worker; these
   * run one after another, so with N callers awaiting completion this may take up to about N times
   * Processor_config::m_poll_interval.  Requests still in flight fail with error::Code::S_WORKER_UNAVAILABLE.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_WORKER_UNAVAILABLE (already closed, or never properly opened); or whatever engine close
   *        reports (the processor is closed regardless).
   */
  void close(Error_code* err_code = 0);

  /**
   * Number of execute_request() calls registered but not yet resolved.
   * @return See above.
   */
  size_t active_requests() const;

  /**
   * Whether execute_request() can currently succeed: constructed successfully and not closed.
   * @return See above.
   */
  bool running() const;

  /**
   * Config given to ctor.
   * @return See above.
   */
  const Processor_config& config() const;

private:
  // Methods.

  /**
   * The poll loop of execute_request(): polls and distributes completions until `result` is resolved.  If the worker
   * becomes unavailable meanwhile, resolves `result` itself with that error.
   *
   * @param result
   *        The caller's slot.
   */
  void await_completion(const detail::Pending_result& result);

  // Data.

  /// See config().
  const Processor_config m_config;

  /// In-flight requests.  Null if ctor failed config validation.
  boost::movelib::unique_ptr<detail::Pending_result_registry> m_registry;

  /// Owner of the engine.  Null if ctor failed config validation.  Declared after #m_registry: destroyed first.
  boost::movelib::unique_ptr<Worker> m_worker;
}; // class Transfer_processor

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_TRANSFER_PROCESSOR \
  template<typename Transfer_engine_t>
/// Internally used macro; public API users should disregard.
#define CLASS_TRANSFER_PROCESSOR \
  Transfer_processor<Transfer_engine_t>

TEMPLATE_TRANSFER_PROCESSOR
CLASS_TRANSFER_PROCESSOR::Transfer_processor(flow::log::Logger* logger_ptr, Engine_factory&& engine_factory,
                                             const Processor_config& config, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSFER),
  m_config(config)
{
  using flow::error::Runtime_error;
  using boost::movelib::make_unique;

  FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Starting with config [" << m_config << "].");

  Error_code our_err_code;
  if (m_config.validate(get_logger(), &our_err_code))
  {
    m_registry = make_unique<detail::Pending_result_registry>(get_logger(), m_config.m_n_registry_shards);
    m_worker = make_unique<Worker>(get_logger(), m_config.m_worker_nickname, std::move(engine_factory),
                                   &our_err_code);
  }

  if (our_err_code)
  {
    FLOW_LOG_WARNING("Transfer_processor [" << *this << "]: Could not start: [" << our_err_code << "] "
                     "[" << our_err_code.message() << "].  Every request will fail.");
    if (err_code)
    {
      *err_code = our_err_code;
      return;
    }
    // else
    throw Runtime_error(our_err_code, FLOW_UTIL_WHERE_AM_I_STR());
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Ready.");
} // Transfer_processor::Transfer_processor()

TEMPLATE_TRANSFER_PROCESSOR
CLASS_TRANSFER_PROCESSOR::~Transfer_processor()
{
  if (running())
  {
    FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Shutting down without close().  "
                  "The worker will now close the engine and stop.");
  }
  // m_worker dtor does the rest (if anything).
}

TEMPLATE_TRANSFER_PROCESSOR
Response_data CLASS_TRANSFER_PROCESSOR::execute_request(const Request_descriptor& request,
                                                        Cancellation_context* cancel_ctx, Error_code* err_code)
{
  Response_data response;
  if (flow::error::exec_and_throw_on_error([&](Error_code* actual_err_code) -> Response_data
                                             { return execute_request(request, cancel_ctx, actual_err_code); },
                                           &response, err_code, "Transfer_processor::execute_request()"))
  {
    return response;
  }
  // else if (err_code): Proceed.

  if (!m_worker)
  {
    FLOW_LOG_WARNING("Transfer_processor [" << *this << "]: Cannot execute [" << request << "]: "
                     "processor failed to start.");
    *err_code = error::Code::S_WORKER_UNAVAILABLE;
    return response;
  }
  // else

  FLOW_LOG_TRACE("Transfer_processor [" << *this << "]: Executing [" << request << "].");

  /* Register before scheduling: once scheduled, the completion may be polled (by anyone) at any moment, and it must
   * find the slot. */
  const auto result = m_registry->register_request(request, err_code);
  if (!result)
  {
    return response; // It logged.
  }
  // else

  Error_code sched_err_code;
  m_worker->schedule(request, &sched_err_code); // The worker keeps the handle; we cancel by identity.
  if (sched_err_code)
  {
    // It logged.  The engine will report nothing for this request; resolve the slot ourselves.
    m_registry->fail_and_remove(request, sched_err_code);
  }
  else
  {
    Cancellation_context::Hook cancel_hook;
    if (cancel_ctx)
    {
      cancel_hook = cancel_ctx->on_cancel([this, request_id = request.id()](const Error_code& cause)
      {
        // We are in the thread that canceled the context (possibly ours, if it was canceled before we got here).
        FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Request ID [" << request_id << "] canceled with "
                      "cause [" << cause << "].  Asking worker to abort it.");
        /* No-op if worker is gone (then our poll will fail anyway) or if the request has meanwhile completed
         * (then the engine may already have given its handle to another request). */
        m_worker->cancel(request_id, cause);
      });
    }

    await_completion(*result);
    // If the context is being canceled concurrently, this waits for our hook to finish; it won't touch *this later.
    cancel_hook.dispose();
  }

  response = result->get(err_code);
  if (*err_code)
  {
    FLOW_LOG_TRACE("Transfer_processor [" << *this << "]: Request [" << request << "] failed: "
                   "[" << *err_code << "] [" << err_code->message() << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Transfer_processor [" << *this << "]: Request [" << request << "] succeeded: "
                   "[" << response << "].");
  }
  return response;
} // Transfer_processor::execute_request()

TEMPLATE_TRANSFER_PROCESSOR
void CLASS_TRANSFER_PROCESSOR::await_completion(const detail::Pending_result& result)
{
  while (!result.ready())
  {
    Error_code poll_err_code;
    auto batch = m_worker->poll_completed_batch(m_config.m_poll_interval, &poll_err_code);
    if (poll_err_code)
    {
      FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Worker became unavailable while awaiting "
                    "[" << result.request() << "].  Failing it.");
      /* Returns false if someone resolved it just before us (whoever removes the entry resolves it, under the same
       * lock we just took); either way it's resolved now. */
      m_registry->fail_and_remove(result.request(), poll_err_code);
      assert(result.ready());
      return;
    }
    // else

    if (!batch.empty())
    {
      const auto n_resolved = m_registry->resolve_and_remove(&batch);
      FLOW_LOG_TRACE("Transfer_processor [" << *this << "]: Resolved [" << n_resolved << "] of "
                     "[" << batch.size() << "] completions polled while awaiting [" << result.request() << "].");
    }
  } // while (!result.ready())
} // Transfer_processor::await_completion()

TEMPLATE_TRANSFER_PROCESSOR
void CLASS_TRANSFER_PROCESSOR::close(Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "Transfer_processor::close()"))
  {
    return;
  }
  // else if (err_code): Proceed.

  if (!m_worker)
  {
    FLOW_LOG_WARNING("Transfer_processor [" << *this << "]: Close requested, but processor failed to start.  "
                     "Ignoring.");
    *err_code = error::Code::S_WORKER_UNAVAILABLE;
    return;
  }
  // else

  FLOW_LOG_INFO("Transfer_processor [" << *this << "]: Closing with [" << active_requests() << "] requests "
                "in flight; they will fail.");
  m_worker->shutdown(err_code); // It logged.
}

TEMPLATE_TRANSFER_PROCESSOR
size_t CLASS_TRANSFER_PROCESSOR::active_requests() const
{
  return m_registry ? m_registry->active_count() : 0;
}

TEMPLATE_TRANSFER_PROCESSOR
bool CLASS_TRANSFER_PROCESSOR::running() const
{
  return m_worker && m_worker->running();
}

TEMPLATE_TRANSFER_PROCESSOR
const Processor_config& CLASS_TRANSFER_PROCESSOR::config() const
{
  return m_config;
}

TEMPLATE_TRANSFER_PROCESSOR
std::ostream& operator<<(std::ostream& os, const CLASS_TRANSFER_PROCESSOR& val)
{
  return os << '[' << val.config().m_worker_nickname << "]@" << static_cast<const void*>(&val);
}

#undef CLASS_TRANSFER_PROCESSOR
#undef TEMPLATE_TRANSFER_PROCESSOR

} // namespace xfer::transfer
