#pragma once

#include "core/result.hpp"

#include <QString>

namespace lanlink::app {

struct LogOptions {
    QString path;                        // empty: stderr only
    qint64 max_bytes = 1024 * 1024;      // rotate to <path>.1 beyond this
    bool debug = false;
};

// <AppLocalDataLocation>/logs/lanlink.log, or empty when unavailable.
QString default_log_file_path();

/**
 * Route all Qt logging through one handler: every line is stamped with
 * time, level and category, written to stderr and appended to the log
 * file. stdout is left alone for the event stream.
 *
 * An unopenable log file is an error, but stderr output is installed anyway.
 */
Result<void, Error> install_logging(const LogOptions& options);

/**
 * Move <path> to <path>.1 when it has grown past max_bytes.
 * Returns true when a rotation happened.
 */
bool rotate_log_file(const QString& path, qint64 max_bytes);

} // namespace lanlink::app
