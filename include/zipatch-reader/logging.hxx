#pragma once

#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

namespace zipatch_reader {
/// Severity levels shared by every logger of this library.
using Severity = boost::log::trivial::severity_level;

/**
 * @class Logger
 * @brief Boost.Log severity source carrying its own verbosity threshold.
 *
 * Each driver owns one Logger built from its Options, so the verbosity is
 * passed explicitly instead of being configured through the logging core.
 * Records below the threshold are never formatted.
 */
class Logger {
public:
  explicit Logger(Severity threshold = Severity::info) : threshold_(threshold) {}

  bool enabled(Severity level) const noexcept { return level >= threshold_; }
  Severity threshold() const noexcept { return threshold_; }

  boost::log::sources::severity_logger<Severity> &source() noexcept {
    return source_;
  }

private:
  Severity threshold_;
  boost::log::sources::severity_logger<Severity> source_;
};
} // namespace zipatch_reader

/**
 * @brief Stream a record into a Logger at one of the boost::log::trivial
 * levels (trace, debug, info, warning, error, fatal).
 *
 * @code{.cpp}
 * ZIPATCH_READER_LOG(log, info) << "Found block type: " << type;
 * @endcode
 */
#define ZIPATCH_READER_LOG(logger, level)                                      \
  if (!(logger).enabled(::boost::log::trivial::level)) {                       \
  } else                                                                       \
    BOOST_LOG_SEV((logger).source(), ::boost::log::trivial::level)
