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

#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include "bstream/common.hpp"
#include "bstream/test/test_common_util.hpp"

namespace bstream::test
{

/**
 * Logger used for testing purposes: a flow::log::Simple_ostream_logger to the console behind its own
 * flow::log::Config.
 *
 * The config knows both component sets a test run produces: Bstream's (bstream::Log_component, including
 * Log_component::S_TEST for the tests' own messages), shown as `bstream-<name>`; and Flow's, shown as `flow-<name>`.
 * Verbosity is one severity for all components, by default test_log_severity(), so a failing test can be rerun with,
 * e.g., `BSTREAM_TEST_LOG_SEV=TRACE` to watch the streams and timers work.  Tests needing more or less can adjust
 * get_config() directly.
 */
class Test_logger :
  public flow::log::Logger
{
public:
  /**
   * Constructor.
   *
   * @param min_severity Lowest severity that will pass through logging filter.
   */
  Test_logger(const flow::log::Sev& min_severity = test_log_severity()) :
    m_config(min_severity),
    m_logger(&m_config)
  {
    // Yes, it is formally (and practically) fine to do this after the Logger took the m_config ptr already.
    m_config.init_component_to_union_idx_mapping<Log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<Log_component>());
    m_config.init_component_names<Log_component>(bstream::S_BSTREAM_LOG_COMPONENT_NAME_MAP, false, "bstream-");
    m_config.init_component_to_union_idx_mapping<flow::Flow_log_component>
      (100, flow::log::Config::standard_component_payload_enum_sparse_length<flow::Flow_log_component>());
    m_config.init_component_names<flow::Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "flow-");
    // Now the logging may commence.
  }

  /**
   * Returns the logging configuration.
   *
   * @return See above.
   */
  flow::log::Config& get_config()
  {
    return *m_logger.m_config;
  }

  /// Forwards to console Logger.
  bool should_log(flow::log::Sev sev, const flow::log::Component& component) const override
  {
    return m_logger.should_log(sev, component);
  }

  /// Forwards to console Logger.
  bool logs_asynchronously() const override
  {
    return m_logger.logs_asynchronously();
  }

  void do_log(flow::log::Msg_metadata* metadata, flow::util::String_view msg) override
  {
    m_logger.do_log(metadata, msg);
  }

private:
  /// Logging configuration.
  flow::log::Config m_config;

  /// The real logger.
  flow::log::Simple_ostream_logger m_logger;
}; // class Test_logger

} // namespace bstream::test
