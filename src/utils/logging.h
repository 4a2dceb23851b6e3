/**
 * @file logging.h
 * @brief Runtime verbose flag for pipeline diagnostics.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace rompipe {

/// Global verbose logging flag, set via --verbose command line argument
inline bool verboseLogging = false;

} // namespace rompipe

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (rompipe::verboseLogging) qDebug()

#endif // LOGGING_H
