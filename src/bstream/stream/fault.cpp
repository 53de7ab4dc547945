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
#include "bstream/stream/fault.hpp"
#include "bstream/error.hpp"
#include <boost/chrono/round.hpp>

namespace bstream::stream
{

Fault::Fault() = default;

Fault::Fault(const Error_code& err_code, const Content_descriptor& descriptor) :
  m_err_code(err_code),
  m_descriptor(descriptor)
{
  // That's it.
}

Fault Fault::too_large(const Content_descriptor& descriptor, uint64_t size, uint64_t limit) // Static.
{
  Fault fault(error::Code::S_TOO_LARGE, descriptor);
  fault.m_observed_size = size;
  fault.m_limit = limit;
  return fault;
}

Fault Fault::timed_out(const Content_descriptor& descriptor, util::Fine_duration elapsed) // Static.
{
  Fault fault(error::Code::S_TIMED_OUT, descriptor);
  fault.m_elapsed = elapsed;
  return fault;
}

Fault Fault::unexpected(const Error_code& cause, const Content_descriptor& descriptor) // Static.
{
  assert(cause && "An unexpected fault needs something to have gone wrong.");

  Fault fault(error::Code::S_UNEXPECTED, descriptor);
  fault.m_cause = cause;
  return fault;
}

Fault Fault::multiple_sources(const Content_descriptor& descriptor) // Static.
{
  return Fault(error::Code::S_MULTIPLE_SOURCES, descriptor);
}

Fault Fault::wrap(const Error_code& err_code, const Content_descriptor& descriptor) // Static.
{
  if (!err_code)
  {
    return Fault();
  }
  // else
  if (error::is_stream_fault(err_code))
  {
    return Fault(err_code, descriptor);
  }
  // else
  return unexpected(err_code, descriptor);
}

Fault::operator bool() const
{
  return bool(m_err_code);
}

const Error_code& Fault::code() const
{
  return m_err_code;
}

const std::optional<Content_descriptor>& Fault::descriptor() const
{
  return m_descriptor;
}

const std::optional<uint64_t>& Fault::observed_size() const
{
  return m_observed_size;
}

const std::optional<uint64_t>& Fault::limit() const
{
  return m_limit;
}

const std::optional<util::Fine_duration>& Fault::elapsed() const
{
  return m_elapsed;
}

const Error_code& Fault::cause() const
{
  return m_cause;
}

std::string Fault::name() const
{
  if (!m_err_code)
  {
    return std::string();
  }
  // else
  if (m_err_code == error::Code::S_TOO_LARGE)
  {
    return "TooLarge";
  }
  if (m_err_code == error::Code::S_TIMED_OUT)
  {
    return "TimedOut";
  }
  if (m_err_code == error::Code::S_MULTIPLE_SOURCES)
  {
    return "MultipleSources";
  }
  // Everything else, typed or not, is reported as what it is to the outside world: unexpected.
  return "Unexpected";
}

std::string Fault::message() const
{
  if (!m_err_code)
  {
    return std::string();
  }
  // else

  auto msg = m_err_code.message();
  if (m_cause)
  {
    msg += "  Cause: ";
    msg += m_cause.message();
  }
  return msg;
}

codec::Value Fault::to_json() const
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  if (!m_err_code)
  {
    return codec::Value(); // null.
  }
  // else

  codec::Value metadata = codec::Value::object();
  if (m_descriptor)
  {
    metadata = *m_descriptor; // Via to_json(Value&, const Content_descriptor&).
  }
  if (m_observed_size)
  {
    metadata["size"] = *m_observed_size;
  }
  if (m_limit)
  {
    metadata["limit"] = *m_limit;
  }
  if (m_elapsed)
  {
    metadata["duration"] = round<milliseconds>(*m_elapsed).count();
  }

  codec::Value json{ { "name", name() },
                     { "code", m_err_code.value() },
                     { "message", message() },
                     { "metadata", std::move(metadata) } };
  if (m_cause)
  {
    json["cause"] = { { "category", m_cause.category().name() },
                      { "code", m_cause.value() },
                      { "message", m_cause.message() } };
  }
  return json;
} // Fault::to_json()

std::ostream& operator<<(std::ostream& os, const Fault& val)
{
  if (!val)
  {
    return os << "no-fault";
  }
  // else

  const auto& err_code = val.code();
  os << err_code.category().name() << '[';
  if (err_code.category() == error::make_error_code(error::Code::S_UNEXPECTED).category())
  {
    os << static_cast<error::Code>(err_code.value());
  }
  else
  {
    os << err_code.value();
  }
  os << "]: " << err_code.message();

  if (val.cause())
  {
    os << " <- " << val.cause() << " [" << val.cause().message() << ']';
  }
  return os;
} // operator<<(Fault)

} // namespace bstream::stream
