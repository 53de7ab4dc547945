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

#include "bstream/stream/fault.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/weak_ptr.hpp>
#include <boost/enable_shared_from_this.hpp>
#include <boost/noncopyable.hpp>

namespace bstream::stream
{

// Types.

/**
 * Abstract asynchronous source of util::Chunk objects, pull-style: the consumer calls async_read_chunk(); the source
 * completes it, on the Task_engine and never synchronously from inside async_read_chunk(), with either a chunk or a
 * terminal code.  All the sources of the library (Buffer_source, File_source, Transform_source, Bounded_stream) are
 * subclasses of this.
 *
 * ### Lifecycle ###
 * A source is *open* until it either *ends* (it emits `boost::asio::error::eof`: no more data, all is well) or is
 * *destroyed* (destroy()).  Once it has ended or been destroyed it is *terminal*: every later read completes with the
 * same terminal code right away (well, posted).  The terminal code of a destroyed source is:
 *   - `eof`, if it had already ended;
 *   - else the code given to destroy(), if truthy;
 *   - else error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
 *
 * destroy() is idempotent.  A read outstanding at destroy() time completes with the terminal code.  A read outstanding
 * when the source object itself goes away (last `Ptr` dropped) completes with
 * error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER.
 *
 * ### Implementing a source ###
 * A subclass implements do_read(), which is called when a read becomes outstanding and the source is open.  It must
 * eventually (synchronously or not) do exactly one of: emit_chunk(), emit_end(), destroy().  Asynchronous steps must
 * guard against `*this` disappearing in the meantime by capturing weak_self() rather than `this`.  It may also
 * override on_destroy() (release resources, propagate to an upstream source) and fault().
 *
 * ### Thread safety ###
 * None.  All calls must be made from the thread running the Task_engine (or before it runs).
 */
class Chunk_source :
  public flow::log::Log_context,
  public boost::enable_shared_from_this<Chunk_source>,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to a source; the usual way sources are held.
  using Ptr = boost::shared_ptr<Chunk_source>;

  /**
   * Completion handler of async_read_chunk(): on success the chunk (non-empty); on failure (including `eof`) an
   * empty chunk.
   */
  using On_chunk_func = Function<void (const Error_code& err_code, util::Chunk&& chunk)>;

  // Constructors/destructor.

  /**
   * Completes any outstanding read with error::Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER (posted).
   * Does not call on_destroy().
   */
  virtual ~Chunk_source();

  // Methods.

  /**
   * Asynchronously obtains the next chunk.  At most one read may be outstanding at a time.
   *
   * @param on_chunk_func
   *        Handler; invoked exactly once, from the Task_engine.
   */
  void async_read_chunk(On_chunk_func&& on_chunk_func);

  /**
   * Tears the source down: it becomes terminal (see class doc header), on_destroy() runs, and any outstanding read
   * completes.  No-op if already destroyed.
   *
   * @param err_code
   *        The reason; falsy means "no error, just stop."
   */
  virtual void destroy(const Error_code& err_code = Error_code());

  /**
   * The source's typed fault, if it keeps one.  The default implementation returns "no fault."  Wrapper sources
   * forward their upstream's, so that a Bounded_stream fed by a chain ending in another Bounded_stream learns of the
   * original TooLarge (or other) fault with its metadata.
   *
   * @return See above.
   */
  virtual Fault fault() const;

  /**
   * Whether the source has ended or been destroyed.
   * @return See above.
   */
  bool terminal() const;

  /**
   * Whether destroy() has been called.
   * @return See above.
   */
  bool destroyed() const;

  /**
   * The terminal code (see class doc header); falsy while open.
   * @return See above.
   */
  const Error_code& terminal_code() const;

  /**
   * Nickname, for logging.
   * @return See above.
   */
  const std::string& nickname() const;

  /**
   * The Task_engine onto which completions are posted.
   * @return See above.
   */
  util::Task_engine* task_engine() const;

protected:
  // Constructors.

  /**
   * Constructs an open source.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname, for logging.
   * @param task_engine
   *        Completions are posted here.  Must outlive `*this`.
   */
  explicit Chunk_source(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine);

  // Methods.

  /// See class doc header.
  virtual void do_read() = 0;

  /**
   * Called once, from destroy(), after the terminal code is set and before the outstanding read (if any) completes.
   * Default: no-op.
   *
   * @param err_code
   *        What was passed to destroy() (possibly falsy).
   */
  virtual void on_destroy(const Error_code& err_code);

  /**
   * Completes the outstanding read with `chunk`.  A read must be outstanding.
   *
   * @param chunk
   *        Data; must not be empty.
   */
  void emit_chunk(util::Chunk&& chunk);

  /// Ends the source (terminal code `eof`) and completes the outstanding read, if any, with `eof`.
  void emit_end();

  /**
   * Whether a read is outstanding.
   * @return See above.
   */
  bool read_pending() const;

  /**
   * A weak pointer to `*this` of the given subclass type, for capture by asynchronous steps.
   *
   * @tparam Source
   *         The (most derived, or at least sufficiently derived) type of `*this`.
   * @return See above.
   */
  template<typename Source>
  boost::weak_ptr<Source> weak_self();

private:
  // Methods.

  /**
   * Posts the outstanding handler with the given result; clears it.
   *
   * @param err_code
   *        Result code.
   * @param chunk
   *        Result chunk.
   */
  void complete_read(const Error_code& err_code, util::Chunk&& chunk);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// See task_engine().
  util::Task_engine* const m_task_engine;

  /// The outstanding read's handler; null if none.
  On_chunk_func m_on_chunk_func;

  /// See terminal_code().
  Error_code m_terminal_err_code;

  /// See destroyed().
  bool m_destroyed;
}; // class Chunk_source

// Free functions.

/**
 * Prints string representation of the given Chunk_source to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Chunk_source& val);

// Template implementations.

template<typename Source>
boost::weak_ptr<Source> Chunk_source::weak_self()
{
  return boost::weak_ptr<Source>(boost::static_pointer_cast<Source>(shared_from_this()));
}

} // namespace bstream::stream
