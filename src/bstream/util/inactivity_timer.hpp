/* Bstream: Core
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

#include "bstream/util/util_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace bstream::util
{

// Types.

/**
 * Detector of stalled activity: fires a one-time callback once no activity has been recorded (via touch()) for at
 * least a configured idle `timeout`, while avoiding reading the clock on every touch().
 *
 * ### Why not simply reschedule a timer on every touch()? ###
 * That is what, e.g., an idle timer on a low-traffic IPC channel would do; and it is fine there.  A stream, however,
 * may see a great many small chunks per second; rescheduling a boost.asio timer (a clock read plus a cancel plus
 * a re-wait) per chunk is needless overhead.  Instead touch() only raises a flag; a periodic *tick* every `interval`
 * converts "the flag is up" into "activity happened as of now" (one clock read per `interval`, not per touch()).
 * A separate *deadline* check fires `timeout` after the latest known activity: it first performs the tick logic
 * (so activity since the last tick is not missed), then computes the elapsed idle time; if that is at least
 * `timeout` the Inactivity_timer fires; otherwise the deadline is rescheduled for the remainder.
 *
 * ### Precision ###
 * Activity is known only with `interval` granularity.  Therefore: the callback never fires before `timeout` of true
 * idleness has elapsed; and it fires at worst `timeout + interval` after the last touch() (plus scheduling
 * latency of the `Task_engine`).  The `elapsed` value passed to the callback is the measured idle time since the
 * latest known activity and is always `>= timeout`.
 *
 * ### Degenerate configurations ###
 *   - `timeout == 0`: disabled.  Nothing is ever scheduled; touch() merely checks the lifecycle; the callback never
 *     fires.
 *   - `interval == 0` (with non-zero `timeout`): no tick.  Each touch() reads the clock and records the activity
 *     time directly.  Precise but not amortized.
 *
 * ### Lifecycle ###
 * Construction starts it.  It dies either via destroy() (explicit, idempotent; also invoked by the destructor) or
 * upon firing.  After death touch() reports error::Code::S_TIMER_DESTROYED; nothing else fires.  At most one
 * callback ever fires per instance.
 *
 * ### Thread safety ###
 * All methods must be called from the thread running the `Task_engine` given to the constructor (or before it runs).
 * The callback is invoked from within that `Task_engine`.  It is fine for the callback to destroy `*this`.
 */
class Inactivity_timer :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /**
   * Signature of the timeout callback: takes the measured idle time since the latest known activity
   * (at least the configured timeout).
   */
  using On_timeout_func = Function<void (Fine_duration elapsed)>;

  // Constructors/destructor.

  /**
   * Constructs and starts the timer: the idle period is measured from now.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param task_engine
   *        The execution context on which the checks run, and from which `on_timeout_func` will be invoked.
   *        Must outlive `*this`.
   * @param timeout
   *        Idle tolerance.  Zero disables the timer (see class doc header).
   * @param interval
   *        Check granularity.  Zero means every touch() reads the clock.
   * @param on_timeout_func
   *        Invoked at most once, from `*task_engine`, upon detecting `timeout` of inactivity.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_INVALID_TIMER_PERIODS (`timeout` or `interval` is negative; or `interval > timeout`).
   *        In case of error the object is dead from the start (alive() is `false`).
   */
  explicit Inactivity_timer(flow::log::Logger* logger_ptr, String_view nickname, Task_engine* task_engine,
                            Fine_duration timeout, Fine_duration interval,
                            On_timeout_func&& on_timeout_func, Error_code* err_code = 0);

  /// Destroys the object, as if by destroy().  The callback shall not be invoked subsequently.
  ~Inactivity_timer();

  // Methods.

  /**
   * Records activity as of now.  The idle period restarts (with `interval` precision; see class doc header).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_TIMER_DESTROYED (destroy() was already invoked, or the timer already fired).
   */
  void touch(Error_code* err_code = 0);

  /**
   * Stops all pending checks; the callback shall not fire.  Idempotent.
   *
   * @return `true` if this call killed the timer; `false` if it was already dead (no-op).
   */
  bool destroy();

  /**
   * Returns `false` if and only if destroy() was invoked (directly or via firing) or construction failed.
   * @return See above.
   */
  bool alive() const;

  /**
   * Returns `true` if and only if timeout() is non-zero.
   * @return See above.
   */
  bool enabled() const;

  /**
   * Idle tolerance given to ctor.
   * @return See above.
   */
  Fine_duration timeout() const;

  /**
   * Check granularity given to ctor.
   * @return See above.
   */
  Fine_duration interval() const;

  /**
   * Nickname given to ctor.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /// If activity has been flagged since the last checkpoint: moves the checkpoint to now and clears the flag.
  void checkpoint();

  /// (Re)schedules the periodic tick `m_interval` from now.
  void schedule_tick();

  /**
   * (Re)schedules the deadline check.
   * @param from_now
   *        Delay.
   */
  void schedule_deadline(Fine_duration from_now);

  /**
   * Tick handler.
   * @param sys_err_code
   *        Result of the timer wait.
   */
  void on_tick(const Error_code& sys_err_code);

  /**
   * Deadline handler: fires or reschedules; see class doc header.
   * @param sys_err_code
   *        Result of the timer wait.
   */
  void on_deadline(const Error_code& sys_err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See timeout().
  const Fine_duration m_timeout;

  /// See interval().
  const Fine_duration m_interval;

  /// See ctor.  Null after firing or destroy().
  On_timeout_func m_on_timeout_func;

  /// Periodic tick: converts the activity flag into a checkpoint.  Unused if `m_interval` is zero.
  Timer m_tick_timer;

  /// Deadline check.
  Timer m_deadline_timer;

  /// Time of the latest known activity (or of construction).
  Fine_time_pt m_last_activity;

  /// Whether touch() has been called since the latest checkpoint().
  bool m_activity_flag;

  /**
   * Liveness token: non-null while alive().  Handlers hold a `weak_ptr` to it, so that a handler queued with a
   * success code before destroy() (or before `*this` is gone) knows to do nothing.
   */
  boost::shared_ptr<bool> m_alive_token;
}; // class Inactivity_timer

// Free functions.

/**
 * Prints string representation of the given Inactivity_timer to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Inactivity_timer& val);

} // namespace bstream::util
