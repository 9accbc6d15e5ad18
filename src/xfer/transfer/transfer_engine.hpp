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

// Not compiled: for documentation only.  Contains concept docs as of this writing.
#ifndef XFER_DOXYGEN_ONLY
#  error "As of this writing this is a documentation-only "header" (the "source" is for humans and Doxygen only)."
#else // ifdef XFER_DOXYGEN_ONLY

namespace xfer::transfer
{

// Types.

/**
 * A documentation-only *concept* defining the native transfer engine driven by Transfer_worker (and thus
 * Transfer_processor): an object that performs any number of network transfers concurrently but must be driven
 * from one thread only.  A typical implementation wraps a multiplexing transfer library (a "multi" handle into
 * which individual transfers are added; a poll call that both advances them and reports finished ones).
 *
 * Flow-Xfer does not implement the wire protocol; the engine does.  The engine also owns retries (if any),
 * connection reuse, TLS and the like.
 *
 * ### Thread safety ###
 * None is required.  Transfer_worker guarantees that every method, as well as the ctor and dtor, is invoked from
 * the same thread; and never concurrently.  The engine is constructed by a factory invoked in that thread, so the
 * engine may use thread-local state.
 *
 * ### Life cycle ###
 * Constructed (by the factory given to Transfer_worker), then any number of schedule/poll/cancel calls, then
 * close() exactly once, then destroyed.  Nothing is called after close() except the dtor.
 */
class Transfer_engine
{
public:
  // Types.

  /**
   * Opaque handle to one scheduled transfer.  Default-constructible; copyable; printable via `ostream<<`.
   * The engine may reuse a handle value once the corresponding transfer has been returned by poll_completed();
   * Transfer_worker never passes such a handle to cancel_request() afterwards.
   */
  using Handle = unspecified;

  // Constructors/destructor.

  /// Destroys the engine, releasing whatever close() did not.
  ~Transfer_engine();

  // Methods.

  /**
   * Begins the given transfer; returns immediately.  Its outcome will be reported by a later poll_completed(),
   * exactly once, as a Completion_record carrying a copy of `request` (so that its identity is preserved).
   *
   * @param request
   *        Description of the transfer.
   * @param err_code
   *        Must not be null.  Set to falsy on success; otherwise the reason the transfer could not even be
   *        scheduled (in which case no Completion_record shall be reported for it).
   * @return Handle to the transfer; meaningless on error.
   */
  Handle schedule_request(const Request_descriptor& request, Error_code* err_code);

  /**
   * Advances transfers, blocking until at least one transfer finishes or `timeout` elapses; then returns all
   * records for transfers that have finished since the last call.  Each scheduled transfer's record is returned
   * exactly once across all calls.
   *
   * @param timeout
   *        Maximum time to block when nothing is ready.
   * @return Records in the order the engine observed completion; possibly empty.
   */
  std::vector<Completion_record> poll_completed(util::Fine_duration timeout);

  /**
   * Aborts the given transfer, best-effort.  If it has not yet finished, the engine shall report it (in a later
   * poll_completed()) as a failure with the given `cause` -- or, if it finished anyway, as whatever it finished as.
   * If it has already been reported, does nothing.
   *
   * @param handle
   *        Handle from schedule_request().
   * @param cause
   *        Cause to report.
   */
  void cancel_request(Handle handle, const Error_code& cause);

  /**
   * Releases the engine's resources, abandoning transfers still in progress (no records are reported for them).
   *
   * @param err_code
   *        Must not be null.  Set to falsy on success; otherwise the reason close did not go smoothly.  Either
   *        way the engine is considered closed.
   */
  void close(Error_code* err_code);
}; // class Transfer_engine

} // namespace xfer::transfer

#endif // XFER_DOXYGEN_ONLY
