#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

namespace tether::app {

/**
 * LogOptions - Where log lines go and how verbose the relay is.
 *
 * stdout carries the Core protocol, so lines only ever go to stderr and,
 * when file_path is set, to that file.
 */
struct LogOptions {
    QString file_path;
    bool relay_debug = false;
};

// <AppLocalDataLocation>/logs/tether.log, or empty if unavailable.
QString default_log_file_path();

// "2026-01-02T03:04:05.006Z W relay: message" for tether categories; other
// categories keep their full name.
QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        const QDateTime& when);

// QLoggingCategory filter rules for the given verbosity.
QString logging_rules(bool relay_debug);

/**
 * Apply the filter rules and install the message handler. Returns false if
 * the log file could not be opened; logging then continues on stderr.
 */
bool install_logging(const LogOptions& options);

} // namespace tether::app
