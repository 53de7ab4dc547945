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

#include "bstream/stream/chunk_source.hpp"
#include "bstream/util/inactivity_timer.hpp"
#include <boost/move/unique_ptr.hpp>
#include <deque>

namespace bstream::stream
{

// Types.

/**
 * A byte stream, bounded by size and by time, that describes its own content.  This is the central class of Bstream.
 *
 * ### What it is ###
 * A Bounded_stream is a Chunk_source (consumers read it with async_read_chunk()) fed by exactly one producer:
 * either the user, via write() and end(); or another Chunk_source, via pipe_from().  Between the two sits a small
 * state machine that enforces:
 *   - a byte limit (limit()): once the running total of bytes received (size()) exceeds it, the stream fails with
 *     a TooLarge Fault.  The breaching chunk, and anything after it, is never delivered to the consumer.  A declared
 *     content length above the limit fails the stream the same way before any data is delivered.
 *   - an inactivity timeout (timeout()): if no data arrives for that long, the stream fails with a TimedOut Fault.
 *     Detection is done by a util::Inactivity_timer, so it is late by at most interval().
 *
 * It also carries content metadata: content type (raw_content_type() as given, content_type() its MIME essence),
 * content encoding, and content length (declared, or once the input ended, observed).  descriptor() exports these,
 * in a form acceptable as constructor input for an equivalent stream.
 *
 * ### States ###
 *   - State::S_OPEN: accepting data.
 *   - State::S_FLUSHED: input ended within bounds; content length known; timer released.  Data not yet read remains
 *     readable, then reads yield `eof`.
 *   - State::S_ERRORED: a fault occurred.  This is transitional: a fault always goes on to destroy the stream.
 *   - State::S_DESTROYED: torn down (by a fault or by destroy()); timer released; reads yield the terminal code.
 *
 * ### Faults ###
 * When the stream fails (a Fault with a error::Code::S_TOO_LARGE, error::Code::S_TIMED_OUT,
 * error::Code::S_UNEXPECTED or error::Code::S_MULTIPLE_SOURCES code):
 *   - fault() starts returning the Fault;
 *   - the handler registered via on_fault(), if any, is invoked once (posted);
 *   - any outstanding read, and every later one, completes with the Fault's code;
 *   - the upstream source (if piped) is destroyed with the same code.
 * Conversely, if the upstream source fails, `*this` fails: with the upstream's own Fault if it has one (so a
 * TooLarge from a Bounded_stream upstream arrives intact), else with an Unexpected Fault around its code.
 *
 * destroy() with a typed stream fault code fails the stream with that code; with any other truthy code it fails the
 * stream with an Unexpected Fault having that cause; with no code it merely tears down (no Fault).  destroy() is
 * idempotent; after the stream flushed or failed it produces no (further) Fault.
 *
 * ### Derived operations ###
 *   - transcode(): the same content in another content encoding, as a new (unbounded) Bounded_stream.
 *   - collect_to_buffer(), collect_to_object(): consume the whole stream into one buffer, or one codec::Value.
 *
 * ### Construction ###
 * Via create() (or the stream_factory.hpp free functions); always held by #Ptr.  Invalid options are reported
 * synchronously by create().
 *
 * ### Thread safety ###
 * None; see Chunk_source.
 */
class Bounded_stream :
  public Chunk_source
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to a stream.
  using Ptr = boost::shared_ptr<Bounded_stream>;

  /// See class doc header.
  enum class State
  {
    /// Accepting data.
    S_OPEN,
    /// Input ended within bounds.
    S_FLUSHED,
    /// Failed; on the way to S_DESTROYED.
    S_ERRORED,
    /// Torn down.
    S_DESTROYED
  };

  /// Fault observer; see on_fault().
  using On_fault_func = Function<void (const Fault& fault)>;

  /// Completion handler of collect_to_buffer(): `fault` is falsy on success.
  using On_buffer_func = Function<void (const Fault& fault, util::Chunk&& bytes)>;

  /// Completion handler of collect_to_object(): `fault` is falsy on success.
  using On_object_func = Function<void (const Fault& fault, codec::Value&& value)>;

  // Constants.

  /// While piped: pull from upstream eagerly until at least this many bytes are queued for the consumer.
  static constexpr size_t S_HIGH_WATER_MARK = 64 * 1024;

  // Constructors/destructor.

  /**
   * Creates a stream in State::S_OPEN and starts its inactivity timer.  If the declared content length exceeds the
   * limit, the stream fails with TooLarge on a later turn of `task_engine` (never synchronously), so the caller can
   * register on_fault() first.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname
   *        Human-readable nickname, for logging.
   * @param task_engine
   *        All asynchronous work (timer, completions) happens here.  Must outlive the stream.
   * @param options
   *        Options; see Stream_options for defaults.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        see resolve_options().
   * @return The stream; null on error.
   */
  static Ptr create(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                    const Stream_options& options = Stream_options(), Error_code* err_code = 0);

  /// Releases the timer.  An outstanding read is aborted as described in Chunk_source.
  ~Bounded_stream() override;

  // Methods.

  /**
   * Producer API: feeds bytes.  Ignored (returns `false`) unless State::S_OPEN.  Doing so while piped from a source
   * is a second producer: the stream fails with MultipleSources.
   *
   * @param bytes
   *        Bytes; copied.  May be empty (then only the timer is touched).
   * @return `true` if and only if the bytes were accepted and the stream is still State::S_OPEN afterwards.
   */
  bool write(const util::Blob_const& bytes);

  /**
   * Same as the other write() but moves the chunk in.
   *
   * @param bytes
   *        Bytes.
   * @return See other overload.
   */
  bool write(util::Chunk&& bytes);

  /**
   * Producer API: signals end of input; the stream flushes (State::S_FLUSHED): content length is set to size() if it
   * was not declared, and the timer is released.  Ignored (returns `false`) unless State::S_OPEN.  Doing so while piped
   * fails the stream with MultipleSources.
   *
   * @return `true` if and only if the stream flushed.
   */
  bool end();

  /**
   * Producer API: makes `source` the producer; `*this` pulls from it from now on.  If `*this` already has a producer
   * (piped, or written to), both `*this` and `source` fail with MultipleSources.  If `*this` is no longer
   * State::S_OPEN, `source` is destroyed (with the code of `*this`'s fault, if any) and `false` returned.
   *
   * @param source
   *        The producer.  Must not be null or `*this`.
   * @return `true` if and only if `source` is now the producer.
   */
  bool pipe_from(Chunk_source::Ptr source);

  /**
   * Registers the fault observer, replacing any previous one.  If the stream already failed, it is invoked (posted)
   * right away; in any case at most once per registration.
   *
   * @param on_fault_func
   *        Observer.
   */
  void on_fault(On_fault_func&& on_fault_func);

  /**
   * See class doc header.
   *
   * @param err_code
   *        Reason; see class doc header.
   */
  void destroy(const Error_code& err_code = Error_code()) override;

  /**
   * The fault, if the stream failed; else "no fault."
   * @return See above.
   */
  Fault fault() const override;

  /**
   * Current state.
   * @return See above.
   */
  State state() const;

  /**
   * Content metadata: raw content type, content encoding token, content length if known and positive.
   * @return See above.
   */
  Content_descriptor descriptor() const;

  /**
   * Content type as supplied, possibly with parameters.
   * @return See above.
   */
  const std::string& raw_content_type() const;

  /**
   * MIME essence of raw_content_type().
   * @return See above.
   */
  const std::string& content_type() const;

  /**
   * Content encoding.
   * @return See above.
   */
  codec::Content_encoding content_encoding() const;

  /**
   * Content length: as declared; else, once flushed, size().  Empty while not known.
   * @return See above.
   */
  const std::optional<uint64_t>& content_length() const;

  /**
   * Total bytes received so far (including the breaching chunk, if the limit was exceeded).
   * @return See above.
   */
  uint64_t size() const;

  /**
   * Byte limit; #S_UNLIMITED if none.
   * @return See above.
   */
  uint64_t limit() const;

  /**
   * Inactivity timeout; zero if disabled.
   * @return See above.
   */
  util::Fine_duration timeout() const;

  /**
   * Inactivity check interval.
   * @return See above.
   */
  util::Fine_duration interval() const;

  /**
   * Whether content_encoding() is not identity.
   * @return See above.
   */
  bool compressed() const;

  /**
   * Whether content_type() can be collected into a codec::Value (see deserializable_content_type()).
   * @return See above.
   */
  bool deserializable() const;

  /**
   * Whether content_type() is a stream of records (see object_stream_content_type()).
   * @return See above.
   */
  bool object_stream() const;

  /**
   * Whether content_type() is `application/...`.
   * @return See above.
   */
  bool app_specific() const;

  /**
   * Whether content_type() is `audio/...`.
   * @return See above.
   */
  bool audio() const;

  /**
   * Whether content_type() is `image/...`.
   * @return See above.
   */
  bool image() const;

  /**
   * Whether content_type() is `multipart/...`.
   * @return See above.
   */
  bool multipart() const;

  /**
   * Whether content_type() is `text/...`.
   * @return See above.
   */
  bool text() const;

  /**
   * Whether content_type() is `video/...`.
   * @return See above.
   */
  bool video() const;

  /**
   * Returns the content in content encoding `encoding`.  If that is content_encoding(), that is `*this` (the same
   * pointer; no new stream, no new timer).  Otherwise a new Bounded_stream piped from `*this` through the
   * Transcoder, with the same raw content type, no declared length (re-encoding changes the byte count), and no
   * limit or timeout: the bounds are enforced by `*this` on the original bytes.  Faults propagate between the two
   * as described in the class doc header.
   *
   * `*this` becomes the new stream's producer's upstream; do not read `*this` directly afterwards.
   *
   * @param encoding
   *        Target encoding.
   * @return See above.
   */
  Ptr transcode(codec::Content_encoding encoding);

  /**
   * Reads the whole stream into one buffer.  If `auto_decompress` and compressed(), the bytes are decompressed on the
   * way.  Completes with the stream's fault if it fails (destroying the stream cancels the collection this way);
   * with an Unexpected fault if the bytes could not be decompressed.
   *
   * @param auto_decompress
   *        See above.
   * @param on_done_func
   *        Handler; invoked once, from the Task_engine.
   */
  void collect_to_buffer(bool auto_decompress, On_buffer_func&& on_done_func);

  /**
   * collect_to_buffer() with decompression, then codec::deserialize() against content_type().  If the stream is not
   * deserializable(), completes at once (posted), without consuming anything, with an Unexpected fault whose cause
   * is codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE.  Malformed content: Unexpected fault with cause
   * codec::error::Code::S_DESERIALIZE_MALFORMED.
   *
   * @param on_done_func
   *        Handler; invoked once, from the Task_engine.
   */
  void collect_to_object(On_object_func&& on_done_func);

protected:
  // Methods.

  /// Implements Chunk_source API.
  void do_read() override;

  /**
   * Implements Chunk_source API: releases timer and queue; destroys upstream with the same reason.
   * @param err_code
   *        See Chunk_source.
   */
  void on_destroy(const Error_code& err_code) override;

private:
  // Constructors.

  /**
   * Constructs the stream; see create().  Does not start anything: start() does (it needs `shared_from_this()`).
   *
   * @param logger_ptr
   *        See create().
   * @param nickname
   *        See create().
   * @param task_engine
   *        See create().
   * @param config
   *        Validated options.
   */
  explicit Bounded_stream(flow::log::Logger* logger_ptr, util::String_view nickname, util::Task_engine* task_engine,
                          const Stream_config& config);

  // Methods.

  /// Creates the timer; schedules the declared-length fault, if applicable.
  void start();

  /**
   * Accounts for an arriving chunk: size, limit, timer; queues it for the consumer.
   * @param chunk
   *        Chunk.
   */
  void accept_chunk(util::Chunk&& chunk);

  /// Completes the outstanding read if possible: a queued chunk, or `eof` after flush.  Then refills from upstream.
  void deliver();

  /// Issues a read upstream if piped, open, and below #S_HIGH_WATER_MARK.
  void pull_upstream();

  /**
   * Handles completion of the read issued by pull_upstream().
   *
   * @param err_code
   *        Upstream result.
   * @param chunk
   *        Upstream chunk.
   */
  void on_upstream_chunk(const Error_code& err_code, util::Chunk&& chunk);

  /// State::S_OPEN -> State::S_FLUSHED.
  void flush();

  /**
   * State::S_OPEN -> State::S_ERRORED -> State::S_DESTROYED with the given fault.  No-op unless State::S_OPEN.
   * @param fault
   *        The fault.
   */
  void fail(const Fault& fault);

  /**
   * Posts the fault observer, if any, with #m_fault.
   */
  void notify_fault();

  // Data.

  /// Validated options.
  const Stream_config m_config;

  /// See state().
  State m_state;

  /// See size().
  uint64_t m_size;

  /// See content_length().
  std::optional<uint64_t> m_content_length;

  /// See fault().
  Fault m_fault;

  /// See on_fault().
  On_fault_func m_on_fault_func;

  /// Stall detection.  Exists from start() on; destroyed (not deleted) on flush and on teardown.
  boost::movelib::unique_ptr<util::Inactivity_timer> m_timer;

  /// Chunks received but not yet read by the consumer.
  std::deque<util::Chunk> m_queue;

  /// Sum of sizes in #m_queue.
  size_t m_queued_size;

  /// The producer source, if piped; null otherwise (and after teardown).
  Chunk_source::Ptr m_upstream;

  /// Whether a read on #m_upstream is in flight.
  bool m_upstream_read_pending;

  /// Whether write() was ever called (the user is the producer).
  bool m_written;

  /// Whether delivery is held back pending the declared-length fault scheduled by start().
  bool m_held;
}; // class Bounded_stream

// Free functions.

/**
 * Prints string representation of the given Bounded_stream to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Bounded_stream& val);

/**
 * Prints string representation of the given state to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Bounded_stream::State val);

} // namespace bstream::stream
