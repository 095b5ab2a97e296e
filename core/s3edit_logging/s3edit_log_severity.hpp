// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_LOG_SEVERITY_HPP
#define S3EDIT_LOG_SEVERITY_HPP

#include <boost/log/expressions/keyword.hpp>

#include <ostream>
#include <string>

namespace s3edit {
namespace logging {

/**
 * Severity levels for s3edit logging.
 */
enum class severity_level { debug = 0, info = 1, warn = 2, error = 3, fatal = 4 };

inline const char* severity_name(severity_level level) {
  switch (level) {
    case severity_level::debug:
      return "DEBUG";
    case severity_level::info:
      return "INFO";
    case severity_level::warn:
      return "WARN";
    case severity_level::error:
      return "ERROR";
    case severity_level::fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
  }
}

inline std::ostream& operator<<(std::ostream& strm, severity_level level) {
  return strm << severity_name(level);
}

// Boost.Log keywords used by filters and formatters
BOOST_LOG_ATTRIBUTE_KEYWORD(severity, "Severity", severity_level)
BOOST_LOG_ATTRIBUTE_KEYWORD(object_key, "ObjectKey", std::string)
BOOST_LOG_ATTRIBUTE_KEYWORD(upload_id, "UploadId", std::string)

}  // namespace logging
}  // namespace s3edit

#endif  // S3EDIT_LOG_SEVERITY_HPP
