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
#include "bstream/stream/bounded_stream.hpp"
#include "bstream/stream/transcoder.hpp"
#include "bstream/codec/serializer.hpp"
#include "bstream/codec/error.hpp"
#include "bstream/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/move/make_unique.hpp>
#include <boost/make_shared.hpp>
#include <boost/asio/post.hpp>

namespace bstream::stream
{

namespace
{

/// Completion handler of collect_all(): falsy on `eof`, else the failure.
using On_collected_func = Function<void (const Error_code& err_code)>;

/**
 * Reads `source` until it is terminal, appending each chunk to `*bytes`.  The read chain holds `source`, so the
 * source lives at least until the collection completes.
 *
 * @param source
 *        Source.
 * @param bytes
 *        Accumulator.
 * @param on_done_func
 *        Invoked once, from a read completion handler.
 */
void collect_all(Chunk_source::Ptr source, boost::shared_ptr<util::Chunk> bytes, On_collected_func&& on_done_func)
{
  auto& source_ref = *source;
  source_ref.async_read_chunk([source = std::move(source), bytes = std::move(bytes),
                               on_done_func = std::move(on_done_func)]
                                (const Error_code& err_code, util::Chunk&& chunk) mutable
  {
    if (err_code)
    {
      on_done_func((err_code == boost::asio::error::eof) ? Error_code() : err_code);
      return;
    }
    // else

    bytes->insert(bytes->end(), chunk.begin(), chunk.end());
    collect_all(std::move(source), std::move(bytes), std::move(on_done_func));
  });
}

} // namespace (anon)

// Implementations.

Bounded_stream::Ptr Bounded_stream::create(flow::log::Logger* logger_ptr, util::String_view nickname,
                                           util::Task_engine* task_engine, const Stream_options& options,
                                           Error_code* err_code) // Static.
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, create, logger_ptr, nickname, task_engine,
                                     flow::util::bind_ns::cref(options), _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_STREAM);

  const auto config = resolve_options(options, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << nickname << "]: Cannot create: options invalid: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return Ptr();
  }
  // else

  // Ctor is private (so no make_shared<>()): users get a Ptr, and start() needs one anyway.
  Ptr stream(new Bounded_stream(logger_ptr, nickname, task_engine, config));
  stream->start();
  return stream;
} // Bounded_stream::create()

Bounded_stream::Bounded_stream(flow::log::Logger* logger_ptr, util::String_view nickname,
                               util::Task_engine* task_engine, const Stream_config& config) :
  Chunk_source(logger_ptr, nickname, task_engine),
  m_config(config),
  m_state(State::S_OPEN),
  m_size(0),
  m_content_length(m_config.m_content_length),
  m_queued_size(0),
  m_upstream_read_pending(false),
  m_written(false),
  m_held(false)
{
  // start() does the rest.
}

Bounded_stream::~Bounded_stream()
{
  FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Going away.");
  // m_timer dtor destroy()s it, if that was not done already.
}

void Bounded_stream::start()
{
  using boost::asio::post;
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  FLOW_LOG_INFO("Bounded_stream [" << *this << "]: Created: declared length "
                "[" << (m_content_length ? std::to_string(*m_content_length) : std::string("unknown")) << "]; "
                "timeout [" << round<milliseconds>(timeout()) << "], interval [" << round<milliseconds>(interval()) << "].");

  // A disabled timer needs no interval (and a non-zero one would be rejected as exceeding the zero timeout).
  const auto timer_interval = (m_config.m_timeout == util::Fine_duration::zero()) ? util::Fine_duration::zero()
                                                                                  : m_config.m_interval;
  m_timer = boost::movelib::make_unique<util::Inactivity_timer>
              (get_logger(), nickname(), task_engine(), m_config.m_timeout, timer_interval,
               [this_weak = weak_self<Bounded_stream>()](util::Fine_duration elapsed)
  {
    const auto self = this_weak.lock();
    if (!self)
    {
      return;
    }
    // else
    self->fail(Fault::timed_out(self->descriptor(), elapsed));
  });

  if (m_content_length && (*m_content_length > m_config.m_limit))
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Declared length [" << *m_content_length << "] exceeds "
                     "limit [" << m_config.m_limit << "]; will fail on the next turn; delivering nothing meanwhile.");
    m_held = true;

    // Not synchronously: the creator has not had a chance to on_fault() yet.
    post(*task_engine(), [this_weak = weak_self<Bounded_stream>()]()
    {
      const auto self = this_weak.lock();
      if (!self)
      {
        return;
      }
      // else
      self->fail(Fault::too_large(self->descriptor(), *self->m_content_length, self->m_config.m_limit));
    });
  }
} // Bounded_stream::start()

bool Bounded_stream::write(const util::Blob_const& bytes)
{
  return write(util::to_chunk(bytes));
}

bool Bounded_stream::write(util::Chunk&& bytes)
{
  if (m_state != State::S_OPEN)
  {
    FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: write() of [" << bytes.size() << "] bytes ignored: not open.");
    return false;
  }
  // else

  if (m_upstream)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: write() while piped from [" << *m_upstream << "]; "
                     "two producers.");
    fail(Fault::multiple_sources(descriptor()));
    return false;
  }
  // else

  m_written = true;
  accept_chunk(std::move(bytes));
  return m_state == State::S_OPEN;
}

bool Bounded_stream::end()
{
  if (m_state != State::S_OPEN)
  {
    FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: end() ignored: not open.");
    return false;
  }
  // else

  if (m_upstream)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: end() while piped from [" << *m_upstream << "]; "
                     "two producers.");
    fail(Fault::multiple_sources(descriptor()));
    return false;
  }
  // else

  flush();
  return m_state == State::S_FLUSHED;
}

bool Bounded_stream::pipe_from(Chunk_source::Ptr source)
{
  assert(source && (source.get() != this));

  if (m_state != State::S_OPEN)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: pipe_from([" << *source << "]) while not open; "
                     "destroying the would-be producer.");
    source->destroy(m_fault.code()); // Falsy if merely flushed or destroyed: plain teardown then.
    return false;
  }
  // else

  if (m_upstream || m_written)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: pipe_from([" << *source << "]) but already have a "
                     "producer; two producers.");
    source->destroy(error::Code::S_MULTIPLE_SOURCES);
    fail(Fault::multiple_sources(descriptor()));
    return false;
  }
  // else

  FLOW_LOG_INFO("Bounded_stream [" << *this << "]: Now piped from [" << *source << "].");
  m_upstream = std::move(source);
  pull_upstream();
  return true;
}

void Bounded_stream::on_fault(On_fault_func&& on_fault_func)
{
  m_on_fault_func = std::move(on_fault_func);
  notify_fault(); // If we already failed.
}

void Bounded_stream::destroy(const Error_code& err_code) // Virtual.
{
  if (destroyed())
  {
    return;
  }
  // else

  if ((m_state == State::S_OPEN) && err_code && (err_code != boost::asio::error::eof))
  {
    fail(Fault::wrap(err_code, descriptor())); // This destroys.
    return;
  }
  // else

  FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Destroying without a fault.");
  Chunk_source::destroy(err_code);
}

Fault Bounded_stream::fault() const // Virtual.
{
  return m_fault;
}

void Bounded_stream::do_read() // Virtual.
{
  deliver();
}

void Bounded_stream::on_destroy(const Error_code& err_code) // Virtual.
{
  m_state = State::S_DESTROYED;
  if (m_timer)
  {
    m_timer->destroy();
  }
  m_queue.clear();
  m_queued_size = 0;
  m_on_fault_func = nullptr;

  if (m_upstream)
  {
    auto upstream = std::move(m_upstream);
    m_upstream.reset();
    upstream->destroy(err_code);
  }
}

void Bounded_stream::accept_chunk(util::Chunk&& chunk)
{
  assert(m_state == State::S_OPEN);

  m_size += chunk.size();
  if (m_size > m_config.m_limit)
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Chunk of [" << chunk.size() << "] bytes brings size past "
                     "limit [" << m_config.m_limit << "]; failing.");
    fail(Fault::too_large(descriptor(), m_size, m_config.m_limit));
    return;
  }
  // else

  m_timer->touch(); // Alive while open: it is only ever destroyed on the way out of S_OPEN.

  FLOW_LOG_DATA("Bounded_stream [" << *this << "]: Accepted chunk of [" << chunk.size() << "] bytes.");
  if (!chunk.empty())
  {
    m_queued_size += chunk.size();
    m_queue.emplace_back(std::move(chunk));
  }

  deliver();
}

void Bounded_stream::deliver()
{
  if (read_pending() && (!m_held))
  {
    if (!m_queue.empty())
    {
      auto chunk = std::move(m_queue.front());
      m_queue.pop_front();
      m_queued_size -= chunk.size();
      emit_chunk(std::move(chunk));
    }
    else if (m_state == State::S_FLUSHED)
    {
      emit_end();
      return;
    }
  }

  pull_upstream();
}

void Bounded_stream::pull_upstream()
{
  if ((!m_upstream) || m_upstream_read_pending || (m_state != State::S_OPEN) || m_held
      || (m_queued_size >= S_HIGH_WATER_MARK))
  {
    return;
  }
  // else

  m_upstream_read_pending = true;
  m_upstream->async_read_chunk([this_weak = weak_self<Bounded_stream>()]
                                 (const Error_code& err_code, util::Chunk&& chunk)
  {
    const auto self = this_weak.lock();
    if (!self)
    {
      return;
    }
    // else
    self->on_upstream_chunk(err_code, std::move(chunk));
  });
}

void Bounded_stream::on_upstream_chunk(const Error_code& err_code, util::Chunk&& chunk)
{
  m_upstream_read_pending = false;

  if (m_state != State::S_OPEN)
  {
    return; // Flushed or failed meanwhile; whatever the upstream had to say no longer matters.
  }
  // else

  if (err_code == boost::asio::error::eof)
  {
    FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Upstream ended.");
    flush();
    return;
  }
  // else

  if (err_code)
  {
    auto upstream_fault = m_upstream->fault();
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Upstream [" << *m_upstream << "] failed with "
                     "[" << err_code << "] [" << err_code.message() << "]; upstream fault [" << upstream_fault << "].");
    fail(upstream_fault ? upstream_fault : Fault::wrap(err_code, descriptor()));
    return;
  }
  // else

  accept_chunk(std::move(chunk)); // This will pull_upstream() again as needed.
}

void Bounded_stream::flush()
{
  assert(m_state == State::S_OPEN);

  if (m_held)
  {
    // Input ended before the scheduled declared-length fault ran.  Still too large; fail now.
    fail(Fault::too_large(descriptor(), *m_content_length, m_config.m_limit));
    return;
  }
  // else

  if (!m_content_length)
  {
    m_content_length = m_size;
  }
  m_state = State::S_FLUSHED;
  m_timer->destroy();
  m_upstream.reset(); // It ended (or there was none).

  FLOW_LOG_INFO("Bounded_stream [" << *this << "]: Input ended within bounds; flushed.");
  deliver();
}

void Bounded_stream::fail(const Fault& fault)
{
  assert(fault);

  if (m_state != State::S_OPEN)
  {
    FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Fault [" << fault << "] ignored: not open.");
    return;
  }
  // else

  m_state = State::S_ERRORED;
  m_fault = fault;
  FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Failing with fault [" << m_fault << "].");

  m_timer->destroy();
  m_queue.clear();
  m_queued_size = 0;

  notify_fault();
  Chunk_source::destroy(m_fault.code()); // -> on_destroy() -> S_DESTROYED; upstream destroyed; reads completed.
}

void Bounded_stream::notify_fault()
{
  using boost::asio::post;

  if ((!m_fault) || (!m_on_fault_func))
  {
    return;
  }
  // else

  post(*task_engine(), [on_fault_func = std::move(m_on_fault_func), fault = m_fault]()
  {
    on_fault_func(fault);
  });
  m_on_fault_func = nullptr;
}

Bounded_stream::State Bounded_stream::state() const
{
  return m_state;
}

Content_descriptor Bounded_stream::descriptor() const
{
  Content_descriptor descriptor;
  descriptor.m_content_type = raw_content_type();
  descriptor.m_content_encoding = codec::content_encoding_token(content_encoding());
  if (m_content_length && (*m_content_length > 0))
  {
    descriptor.m_content_length = m_content_length;
  }
  return descriptor;
}

const std::string& Bounded_stream::raw_content_type() const
{
  return m_config.m_raw_content_type;
}

const std::string& Bounded_stream::content_type() const
{
  return m_config.m_content_type;
}

codec::Content_encoding Bounded_stream::content_encoding() const
{
  return m_config.m_content_encoding;
}

const std::optional<uint64_t>& Bounded_stream::content_length() const
{
  return m_content_length;
}

uint64_t Bounded_stream::size() const
{
  return m_size;
}

uint64_t Bounded_stream::limit() const
{
  return m_config.m_limit;
}

util::Fine_duration Bounded_stream::timeout() const
{
  return m_config.m_timeout;
}

util::Fine_duration Bounded_stream::interval() const
{
  return m_config.m_interval;
}

bool Bounded_stream::compressed() const
{
  return content_encoding() != codec::Content_encoding::S_IDENTITY;
}

bool Bounded_stream::deserializable() const
{
  return deserializable_content_type(content_type());
}

bool Bounded_stream::object_stream() const
{
  return object_stream_content_type(content_type());
}

bool Bounded_stream::app_specific() const
{
  return boost::algorithm::starts_with(content_type(), "application/");
}

bool Bounded_stream::audio() const
{
  return boost::algorithm::starts_with(content_type(), "audio/");
}

bool Bounded_stream::image() const
{
  return boost::algorithm::starts_with(content_type(), "image/");
}

bool Bounded_stream::multipart() const
{
  return boost::algorithm::starts_with(content_type(), "multipart/");
}

bool Bounded_stream::text() const
{
  return boost::algorithm::starts_with(content_type(), "text/");
}

bool Bounded_stream::video() const
{
  return boost::algorithm::starts_with(content_type(), "video/");
}

Bounded_stream::Ptr Bounded_stream::transcode(codec::Content_encoding encoding)
{
  const auto self = boost::static_pointer_cast<Bounded_stream>(shared_from_this());
  if (encoding == content_encoding())
  {
    return self;
  }
  // else

  const auto token = codec::content_encoding_token(encoding);
  FLOW_LOG_INFO("Bounded_stream [" << *this << "]: Transcoding to [" << token << "].");

  auto source = stream::transcode(get_logger(), content_encoding(), encoding, self);

  Stream_options options;
  options.m_content_type = raw_content_type();
  options.m_content_encoding = std::string(token);
  // We enforce the bounds on the original bytes; the derived stream does not re-enforce them.
  options.m_limit = S_UNLIMITED;
  options.m_timeout = util::Fine_duration::zero();
  options.m_interval = util::Fine_duration::zero();

  std::string transcoded_nickname(nickname());
  transcoded_nickname += '/';
  transcoded_nickname += token;

  // Cannot fail: our own content type was validated already, and the rest is fixed.
  auto transcoded = create(get_logger(), transcoded_nickname, task_engine(), options);
  transcoded->pipe_from(std::move(source));
  return transcoded;
} // Bounded_stream::transcode()

void Bounded_stream::collect_to_buffer(bool auto_decompress, On_buffer_func&& on_done_func)
{
  const auto self = boost::static_pointer_cast<Bounded_stream>(shared_from_this());

  Chunk_source::Ptr source = self;
  if (auto_decompress && compressed())
  {
    source = decompress(get_logger(), content_encoding(), std::move(source));
  }

  FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Collecting into a buffer via [" << *source << "].");

  auto bytes = boost::make_shared<util::Chunk>();
  collect_all(std::move(source), bytes,
              [this, self, bytes, on_done_func = std::move(on_done_func)](const Error_code& err_code)
  {
    if (!err_code)
    {
      FLOW_LOG_TRACE("Bounded_stream [" << *this << "]: Collected [" << bytes->size() << "] bytes.");
      on_done_func(Fault(), std::move(*bytes));
      return;
    }
    // else

    auto fault = self->fault();
    if (!fault)
    {
      // Consumption error not already a stream fault (e.g., corrupt compressed data after the input ended).
      fault = Fault::wrap(err_code, descriptor());
    }
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Collection failed: [" << fault << "].");
    on_done_func(fault, util::Chunk());
  });
} // Bounded_stream::collect_to_buffer()

void Bounded_stream::collect_to_object(On_object_func&& on_done_func)
{
  using boost::asio::post;

  if (!deserializable())
  {
    FLOW_LOG_WARNING("Bounded_stream [" << *this << "]: Cannot collect into a document: content type "
                     "[" << content_type() << "] is not deserializable.");
    post(*task_engine(),
         [on_done_func = std::move(on_done_func),
          fault = Fault::unexpected(codec::error::Code::S_UNSUPPORTED_CONTENT_TYPE, descriptor())]()
    {
      on_done_func(fault, codec::Value());
    });
    return;
  }
  // else

  const auto self = boost::static_pointer_cast<Bounded_stream>(shared_from_this());
  collect_to_buffer(true, [this, self, on_done_func = std::move(on_done_func)](const Fault& fault, util::Chunk&& bytes)
  {
    if (fault)
    {
      on_done_func(fault, codec::Value());
      return;
    }
    // else

    Error_code err_code;
    auto value = codec::deserialize(get_logger(), content_type(), util::Blob_const(bytes.data(), bytes.size()),
                                    &err_code);
    if (err_code)
    {
      on_done_func(Fault::unexpected(err_code, descriptor()), codec::Value());
      return;
    }
    // else
    on_done_func(Fault(), std::move(value));
  });
} // Bounded_stream::collect_to_object()

std::ostream& operator<<(std::ostream& os, const Bounded_stream& val)
{
  return os << static_cast<const Chunk_source&>(val)
            << " [" << val.raw_content_type() << "] [" << val.content_encoding() << "] "
               "size [" << val.size() << '/' << val.limit() << "] state [" << val.state() << ']';
}

std::ostream& operator<<(std::ostream& os, Bounded_stream::State val)
{
  switch (val)
  {
  case Bounded_stream::State::S_OPEN:
    return os << "OPEN";
  case Bounded_stream::State::S_FLUSHED:
    return os << "FLUSHED";
  case Bounded_stream::State::S_ERRORED:
    return os << "ERRORED";
  case Bounded_stream::State::S_DESTROYED:
    return os << "DESTROYED";
  }
  assert(false);
  return os;
}

} // namespace bstream::stream
