// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_CONSOLE_SINK_HPP
#define S3EDIT_CONSOLE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <ostream>

#include "s3edit_log_severity.hpp"

namespace s3edit {
namespace logging {

/**
 * Async console sink with bounded queue.
 * Records are dropped on overflow so part transfers never block on stderr.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create the console sink.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to wrap the level tag in ANSI color codes
 * @return Shared pointer to the sink (not yet registered with the core)
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * Same as create_console_sink() but writes to the given stream.
 * The stream must outlive the sink.
 */
boost::shared_ptr<async_console_sink_t> create_stream_sink(
  std::ostream& stream, severity_level min_level, bool use_colors
);

/**
 * ANSI color prefix for a level, empty for unknown levels.
 */
const char* get_color(severity_level level);

}  // namespace logging
}  // namespace s3edit

#endif  // S3EDIT_CONSOLE_SINK_HPP
