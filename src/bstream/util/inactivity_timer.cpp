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
#include "bstream/util/inactivity_timer.hpp"
#include "bstream/error.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>

namespace bstream::util
{

Inactivity_timer::Inactivity_timer(flow::log::Logger* logger_ptr, String_view nickname, Task_engine* task_engine,
                                   Fine_duration timeout, Fine_duration interval,
                                   On_timeout_func&& on_timeout_func, Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_UTIL),
  m_nickname(nickname),
  m_timeout(timeout),
  m_interval(interval),
  m_on_timeout_func(std::move(on_timeout_func)),
  m_tick_timer(*task_engine),
  m_deadline_timer(*task_engine),
  m_last_activity(Fine_clock::now()),
  m_activity_flag(false)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  if ((m_timeout < Fine_duration::zero()) || (m_interval < Fine_duration::zero()) || (m_interval > m_timeout))
  {
    FLOW_LOG_WARNING("Inactivity_timer [" << *this << "]: Invalid periods: timeout "
                     "[" << round<milliseconds>(m_timeout) << "], interval [" << round<milliseconds>(m_interval) << "]; "
                     "must be non-negative with interval <= timeout.");
    m_on_timeout_func = nullptr;
    const Error_code bad_periods_err_code = error::Code::S_INVALID_TIMER_PERIODS;
    if (err_code)
    {
      *err_code = bad_periods_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(bad_periods_err_code, "Inactivity_timer::Inactivity_timer()");
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }
  m_alive_token = boost::make_shared<bool>(true);

  if (!enabled())
  {
    FLOW_LOG_TRACE("Inactivity_timer [" << *this << "]: Started disabled (zero timeout); will never fire.");
    return;
  }
  // else

  FLOW_LOG_INFO("Inactivity_timer [" << *this << "]: Started with timeout [" << round<milliseconds>(m_timeout) << "], "
                "interval [" << round<milliseconds>(m_interval) << "].");

  if (m_interval != Fine_duration::zero())
  {
    schedule_tick();
  }
  schedule_deadline(m_timeout);
} // Inactivity_timer::Inactivity_timer()

Inactivity_timer::~Inactivity_timer()
{
  destroy();
}

void Inactivity_timer::touch(Error_code* err_code)
{
  if (!alive())
  {
    const Error_code dead_err_code = error::Code::S_TIMER_DESTROYED;
    FLOW_LOG_WARNING("Inactivity_timer [" << *this << "]: touch() called after death.");
    if (err_code)
    {
      *err_code = dead_err_code;
      return;
    }
    // else
    throw flow::error::Runtime_error(dead_err_code, "Inactivity_timer::touch()");
  }
  // else

  if (err_code)
  {
    err_code->clear();
  }

  if (!enabled())
  {
    return;
  }
  // else

  if (m_interval == Fine_duration::zero())
  {
    // No tick to amortize over: just read the clock.
    m_last_activity = Fine_clock::now();
  }
  else
  {
    m_activity_flag = true;
  }
} // Inactivity_timer::touch()

bool Inactivity_timer::destroy()
{
  if (!alive())
  {
    return false;
  }
  // else

  FLOW_LOG_TRACE("Inactivity_timer [" << *this << "]: Destroying.");

  // Any handler already queued with a success code will see the token expired and do nothing.
  m_alive_token.reset();
  m_on_timeout_func = nullptr;
  m_tick_timer.cancel();
  m_deadline_timer.cancel();
  return true;
}

bool Inactivity_timer::alive() const
{
  return bool(m_alive_token);
}

bool Inactivity_timer::enabled() const
{
  return m_timeout != Fine_duration::zero();
}

Fine_duration Inactivity_timer::timeout() const
{
  return m_timeout;
}

Fine_duration Inactivity_timer::interval() const
{
  return m_interval;
}

const std::string& Inactivity_timer::nickname() const
{
  return m_nickname;
}

void Inactivity_timer::checkpoint()
{
  if (m_activity_flag)
  {
    m_last_activity = Fine_clock::now();
    m_activity_flag = false;
  }
}

void Inactivity_timer::schedule_tick()
{
  m_tick_timer.expires_after(m_interval);
  m_tick_timer.async_wait([this, alive = boost::weak_ptr<bool>(m_alive_token)](const Error_code& sys_err_code)
  {
    if ((sys_err_code == boost::asio::error::operation_aborted) || alive.expired())
    {
      return; // Stuff is shutting down, or we were destroy()ed after the firing was queued.  Do nothing.
    }
    // else
    on_tick(sys_err_code);
  });
}

void Inactivity_timer::schedule_deadline(Fine_duration from_now)
{
  m_deadline_timer.expires_after(from_now);
  m_deadline_timer.async_wait([this, alive = boost::weak_ptr<bool>(m_alive_token)](const Error_code& sys_err_code)
  {
    if ((sys_err_code == boost::asio::error::operation_aborted) || alive.expired())
    {
      return;
    }
    // else
    on_deadline(sys_err_code);
  });
}

void Inactivity_timer::on_tick(const Error_code& sys_err_code)
{
  if (sys_err_code)
  {
    // Should not happen with a steady timer; but do not spin on it either.
    FLOW_LOG_WARNING("Inactivity_timer [" << *this << "]: Tick wait reported error [" << sys_err_code << "] "
                     "[" << sys_err_code.message() << "]; ticks stop; deadline checks will still see activity.");
    return;
  }
  // else

  checkpoint();
  schedule_tick();
}

void Inactivity_timer::on_deadline(const Error_code& sys_err_code)
{
  using boost::chrono::round;
  using boost::chrono::milliseconds;

  if (sys_err_code)
  {
    FLOW_LOG_WARNING("Inactivity_timer [" << *this << "]: Deadline wait reported error [" << sys_err_code << "] "
                     "[" << sys_err_code.message() << "]; treating as a deadline check anyway.");
  }

  checkpoint();
  const auto elapsed = Fine_clock::now() - m_last_activity;

  if (elapsed < m_timeout)
  {
    FLOW_LOG_TRACE("Inactivity_timer [" << *this << "]: Deadline check: idle for only "
                   "[" << round<milliseconds>(elapsed) << "]; rescheduling for the remainder.");
    schedule_deadline(m_timeout - elapsed);
    return;
  }
  // else

  FLOW_LOG_INFO("Inactivity_timer [" << *this << "]: Idle for [" << round<milliseconds>(elapsed) << "] >= timeout "
                "[" << round<milliseconds>(m_timeout) << "].  Firing.");

  // Move it out first: destroy() clears it; and the callback may well destroy *this.
  auto on_timeout_func = std::move(m_on_timeout_func);
  destroy();
  if (on_timeout_func)
  {
    on_timeout_func(elapsed);
  }
} // Inactivity_timer::on_deadline()

std::ostream& operator<<(std::ostream& os, const Inactivity_timer& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val);
}

} // namespace bstream::util
