#pragma once

#include <QString>

namespace ladle::app {

/**
 * Route Qt logging to <data dir>/logs/ladle.log, one
 * "<iso-time> <level> <category> <message>" line per message. Warnings and
 * worse are echoed to stderr. A log over 5 MB is moved to ladle.log.1 when
 * first opened. Calling it again does nothing.
 */
void install_file_logging();

QString default_log_file_path();

} // namespace ladle::app
