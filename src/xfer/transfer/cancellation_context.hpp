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
#include "xfer/transfer/error.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <boost/thread/condition_variable.hpp>
#include <boost/thread/thread.hpp>
#include <map>

namespace xfer::transfer
{

// Types.

/**
 * A one-shot, thread-safe cancellation signal through which a caller of Transfer_processor::execute_request()
 * (or anyone else holding it) can abort the transfer(s) started with it.  cancel() may be called from any thread,
 * at any time, any number of times; only the first call has an effect.  Interested parties register hooks via
 * on_cancel(); each hook is invoked exactly once, with the cancellation cause, unless it is disposed first.
 *
 * One context may be given to any number of execute_request() calls; cancel() then aborts all of them.
 *
 * ### Hook execution ###
 * Hooks run synchronously inside cancel(), in the thread that called it, in registration order, and outside any
 * internal lock; so a hook may itself call into `*this` (e.g., dispose a Hook).  A hook registered after cancel()
 * runs synchronously inside on_cancel().  Hooks should be quick and non-blocking: Transfer_processor's hook merely
 * posts a cancel request onto the worker thread; and Hook::dispose() from another thread may be waiting on it.
 *
 * ### Lifetime ###
 * Each Hook must be destroyed (or disposed) before `*this` is destroyed.
 */
class Cancellation_context :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Signature of a hook: receives the cause given to cancel().
  using On_cancel_func = Function<void (const Error_code& cause)>;

  /**
   * Move-only registration token returned by on_cancel().  dispose() -- invoked automatically by the destructor --
   * unregisters the hook; once it returns, the hook is not running and will never run.  If the hook is running at
   * that moment (in the thread inside cancel()), dispose() waits for it to return; unless dispose() is called by the
   * hook itself (or otherwise from that thread), which does not wait.
   */
  class Hook
  {
  public:
    // Constructors/destructor.

    /// Creates an inactive token, registered with nothing.
    Hook();

    /**
     * Move-constructs: `src` becomes inactive.
     * @param src
     *        Moved-from.
     */
    Hook(Hook&& src);

    /// Disposes.
    ~Hook();

    // Methods.

    /**
     * Disposes `*this`, then takes over `src`'s registration; `src` becomes inactive.
     * @param src
     *        Moved-from.
     * @return `*this`.
     */
    Hook& operator=(Hook&& src);

    /// Unregisters the hook if still registered; no-op otherwise.  `*this` becomes inactive.
    void dispose();

    /**
     * Whether `*this` still holds a registration.  `false` after dispose(), after a move-from, and for a hook that
     * on_cancel() had to invoke immediately.  Note: a registered hook that has been invoked by cancel() still
     * counts as active until disposed.
     *
     * @return See above.
     */
    bool active() const;

  private:
    // Friends.

    /// Only the context makes non-trivial Hooks.
    friend class Cancellation_context;

    // Constructors.

    /**
     * Constructs an active token.
     *
     * @param ctx
     *        See m_ctx.
     * @param id
     *        See m_id.
     */
    explicit Hook(Cancellation_context* ctx, uint64_t id);

    // Data.

    /// The context with which the hook is registered; null if inactive.
    Cancellation_context* m_ctx;

    /// Registration key in `m_ctx->m_hooks`.
    uint64_t m_id;
  }; // class Hook

  // Constructors/destructor.

  /**
   * Constructs a not-yet-canceled context.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname_str
   *        Human-readable name for logging.
   */
  explicit Cancellation_context(flow::log::Logger* logger_ptr, util::String_view nickname_str);

  /// Destroys the context; any remaining hooks are dropped without being invoked.
  ~Cancellation_context();

  // Methods.

  /**
   * Cancels the context, invoking every registered hook with `cause`; or does nothing if already canceled.
   *
   * @param cause
   *        Cause to report to hooks.  If falsy, error::Code::S_REQUEST_CANCELED is used instead.
   * @return `true` if this call canceled the context; `false` if it was already canceled.
   */
  bool cancel(const Error_code& cause = error::Code::S_REQUEST_CANCELED);

  /**
   * Registers a hook to be invoked upon cancel().  If already canceled, invokes `on_cancel_func` synchronously
   * with the original cause before returning, and returns an inactive Hook.
   *
   * @param on_cancel_func
   *        The hook.
   * @return Registration token; dispose it (or let it be destroyed) to unregister.
   */
  Hook on_cancel(On_cancel_func&& on_cancel_func);

  /**
   * Whether cancel() has been called.
   * @return See above.
   */
  bool canceled() const;

  /**
   * The cause given to the first cancel(); falsy if not canceled.
   * @return See above.
   */
  Error_code cause() const;

  /**
   * Number of hooks currently registered (not yet disposed).
   * @return See above.
   */
  size_t hook_count() const;

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /**
   * Implements Hook::dispose().
   * @param id
   *        Registration key.
   */
  void remove_hook(uint64_t id);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// Protects the other mutable data members.
  mutable util::Mutex_non_recursive m_mutex;

  /// See cause(); falsy until canceled.
  Error_code m_cause;

  /// Registered hooks, keyed by registration order.
  std::map<uint64_t, On_cancel_func> m_hooks;

  /// Key for the next registered hook.
  uint64_t m_next_hook_id;

  /// Key of the hook cancel() is invoking at the moment (it is no longer in #m_hooks); 0 if none.
  uint64_t m_running_hook_id;

  /// Thread that called the effective cancel(); default until then.
  boost::thread::id m_canceling_thread_id;

  /// Signaled (with #m_mutex) whenever #m_running_hook_id returns to 0.
  boost::condition_variable m_hook_done;
}; // class Cancellation_context

} // namespace xfer::transfer
