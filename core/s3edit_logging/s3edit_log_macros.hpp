// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef S3EDIT_LOG_MACROS_HPP
#define S3EDIT_LOG_MACROS_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/attributes/scoped_attribute.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <sstream>
#include <string>

#include "s3edit_log_severity.hpp"

namespace s3edit {
namespace logging {

typedef boost::log::sources::severity_logger_mt<severity_level> logger_type;

/**
 * Process-wide logger. Defined in s3edit_log_init.cpp.
 */
logger_type& get_logger();

/**
 * Key-value field for structured messages.
 * Usage: S3EDIT_LOG_INFO("copy part" << kv("part", n));
 */
template <typename T>
inline std::string kv(const char* name, const T& value) {
  std::ostringstream oss;
  oss << " " << name << "=" << value;
  return oss.str();
}

template <>
inline std::string kv(const char* name, const std::string& value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

inline std::string kv(const char* name, const char* value) {
  std::ostringstream oss;
  oss << " " << name << "=\"" << value << "\"";
  return oss.str();
}

}  // namespace logging
}  // namespace s3edit

// Define S3EDIT_LOG_COMPONENT before including this header to tag records
// with the emitting compilation unit.
#ifndef S3EDIT_LOG_COMPONENT
#define S3EDIT_LOG_COMPONENT "s3edit"
#endif

// DEBUG records are compiled out of release builds unless the build
// defines S3EDIT_LOG_ENABLE_DEBUG itself
#ifndef S3EDIT_LOG_ENABLE_DEBUG
#ifdef NDEBUG
#define S3EDIT_LOG_ENABLE_DEBUG 0
#else
#define S3EDIT_LOG_ENABLE_DEBUG 1
#endif
#endif

#define S3EDIT_LOG_AT(level, msg)                                                     \
  do {                                                                                \
    BOOST_LOG_SEV(::s3edit::logging::get_logger(), ::s3edit::logging::severity_level::level) \
      << "[" << S3EDIT_LOG_COMPONENT << "] " << msg;                                  \
  } while (0)

#define S3EDIT_LOG_DEBUG(msg)        \
  do {                               \
    if (S3EDIT_LOG_ENABLE_DEBUG) {   \
      S3EDIT_LOG_AT(debug, msg);     \
    }                                \
  } while (0)

#define S3EDIT_LOG_INFO(msg) S3EDIT_LOG_AT(info, msg)
#define S3EDIT_LOG_WARN(msg) S3EDIT_LOG_AT(warn, msg)
#define S3EDIT_LOG_ERROR(msg) S3EDIT_LOG_AT(error, msg)
#define S3EDIT_LOG_FATAL(msg) S3EDIT_LOG_AT(fatal, msg)

// Tags every record emitted by this thread until the enclosing scope exits.
// At most one per scope.
// Usage: S3EDIT_LOG_SCOPED_CONTEXT(key, upload_id);
#define S3EDIT_LOG_SCOPED_CONTEXT(key_val, upload_id_val)                              \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                               \
    ::s3edit::logging::tag::object_key::get_name(),                                   \
    boost::log::attributes::constant<std::string>(key_val),                            \
    s3edit_log_object_key_sentry_                                                      \
  )                                                                                    \
  BOOST_LOG_SCOPED_THREAD_ATTR_INTERNAL(                                               \
    ::s3edit::logging::tag::upload_id::get_name(),                                    \
    boost::log::attributes::constant<std::string>(upload_id_val),                      \
    s3edit_log_upload_id_sentry_                                                       \
  )

#endif  // S3EDIT_LOG_MACROS_HPP
