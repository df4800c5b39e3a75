#include "app/logging.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <cstdio>

namespace tether::app {
namespace {

constexpr const char* kCategoryPrefix = "tether.";

// Relay categories switched to debug by --debug-relay.
constexpr const char* kRelayCategories[] = {"relay", "link", "commands", "sms"};

char level_letter(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return 'D';
        case QtInfoMsg: return 'I';
        case QtWarningMsg: return 'W';
        case QtCriticalMsg: return 'C';
        case QtFatalMsg: return 'F';
    }
    return '?';
}

/**
 * LogSink - The file half of the handler. One per process, guarded by its
 * own mutex because Qt may log from any thread.
 */
class LogSink {
public:
    static LogSink& instance() {
        static LogSink sink;
        return sink;
    }

    bool open(const QString& path) {
        QMutexLocker lock(&mu_);
        if (file_.isOpen()) {
            file_.close();
        }
        if (path.isEmpty()) {
            return true;
        }
        QDir().mkpath(QFileInfo(path).absolutePath());
        file_.setFileName(path);
        return file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text);
    }

    void write(const QByteArray& line) {
        QMutexLocker lock(&mu_);
        if (file_.isOpen()) {
            file_.write(line);
            file_.flush();
        }
        std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    }

private:
    QMutex mu_;
    QFile file_;
};

void message_handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const auto line = format_log_line(type, ctx.category, msg, QDateTime::currentDateTimeUtc());
    LogSink::instance().write(line.toUtf8());
}

} // namespace

QString default_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/tether.log"));
}

QString format_log_line(QtMsgType type,
                        const char* category,
                        const QString& message,
                        const QDateTime& when) {
    QString cat = category ? QString::fromLatin1(category) : QString{};
    if (cat.startsWith(QLatin1String(kCategoryPrefix))) {
        cat.remove(0, static_cast<qsizetype>(qstrlen(kCategoryPrefix)));
    } else if (cat.isEmpty() || cat == QLatin1String("default")) {
        cat = QStringLiteral("qt");
    }

    return QStringLiteral("%1 %2 %3: %4\n")
        .arg(when.toUTC().toString(Qt::ISODateWithMs),
             QString(QChar::fromLatin1(level_letter(type))),
             cat,
             message);
}

QString logging_rules(bool relay_debug) {
    QString rules = QStringLiteral("tether.*.debug=false\n");
    if (relay_debug) {
        for (const char* name : kRelayCategories) {
            rules += QStringLiteral("tether.%1.debug=true\n").arg(QLatin1String(name));
        }
    }
    return rules;
}

bool install_logging(const LogOptions& options) {
    QLoggingCategory::setFilterRules(logging_rules(options.relay_debug));

    const bool opened = LogSink::instance().open(options.file_path);
    qInstallMessageHandler(message_handler);
    if (!opened) {
        qWarning("cannot open log file %s", qPrintable(options.file_path));
    }
    return opened;
}

} // namespace tether::app
