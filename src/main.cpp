#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QLoggingCategory>
#include <QTextStream>
#include <unistd.h>

#include "app/cli/summary.hpp"
#include "app/context.hpp"
#include "app/logging.hpp"
#include "app/settings.hpp"
#include "core/log.hpp"
#include "network/stdio_core_link.hpp"

namespace {

int run_replay(const QString& path, bool json, const tether::app::RelaySettings& settings) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        QTextStream(stderr) << "cannot open " << path << ": " << file.errorString() << QLatin1Char('\n');
        return 1;
    }

    // The link outlives the context, which detaches its callbacks on teardown.
    tether::network::StdioCoreLink link(-1, nullptr);
    tether::app::AppContext context(settings);
    context.attachCore(&link, &link);

    link.feed(file.readAll());
    link.finish();
    context.drainNow();

    const auto devices = context.cache().getAll();
    if (json) {
        QTextStream(stdout) << tether::app::format_device_list_json(devices);
        return 0;
    }

    QTextStream out(stdout);
    out << tether::app::format_device_list(devices);
    const auto conversations = context.sms().conversations();
    if (!conversations.empty()) {
        out << QLatin1Char('\n')
            << tether::app::format_conversation_list(conversations, tether::Timestamp::now());
    }
    if (link.droppedLines() > 0) {
        QTextStream(stderr) << link.droppedLines() << " malformed line(s) skipped\n";
    }
    return 0;
}

int run_bridge(QCoreApplication& app, const tether::app::RelaySettings& settings) {
    QFile output;
    if (!output.open(stdout, QIODevice::WriteOnly | QIODevice::Unbuffered)) {
        qCCritical(tetherAppLog) << "cannot open stdout:" << output.errorString();
        return 1;
    }

    tether::network::StdioCoreLink link(STDIN_FILENO, &output);
    tether::app::AppContext context(settings);
    context.attachCore(&link, &link);

    QObject::connect(&context.relay(), &tether::network::EventRelay::pairingRequested, &app,
                     [](const tether::network::PairingNotification& n) {
                         qCInfo(tetherAppLog) << "pairing request:" << n.device_name
                                              << "(" << n.device_type << ")" << n.device_id.value();
                     });
    QObject::connect(&context.relay(), &tether::network::EventRelay::stopped,
                     &app, &QCoreApplication::quit, Qt::QueuedConnection);

    auto started = context.start();
    if (started.is_err()) {
        qCCritical(tetherAppLog) << "failed to start relay:"
                                 << started.unwrap_err().message.c_str();
        return 1;
    }

    return app.exec();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Tether");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tether");
    app.setOrganizationDomain("tether.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("KDE Connect event relay"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugRelayOption(
        QStringList{QStringLiteral("debug-relay")},
        QStringLiteral("Enable relay debug logging (also sets TETHER_DEBUG_RELAY=1)."));
    parser.addOption(debugRelayOption);

    const QCommandLineOption noLogFileOption(
        QStringList{QStringLiteral("no-log-file")},
        QStringLiteral("Log to stderr only."));
    parser.addOption(noLogFileOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("'run' (default) or 'replay <file>'."));
    parser.process(app);

    const bool debugRelay = parser.isSet(debugRelayOption) || qEnvironmentVariableIsSet("TETHER_DEBUG_RELAY");
    if (debugRelay) {
        qputenv("TETHER_DEBUG_RELAY", "1");
    }

    const auto settings = tether::app::load_settings();
    const auto positional = parser.positionalArguments();
    const bool replay = !positional.isEmpty() && positional.first() == QStringLiteral("replay");

    // Replays are one-off runs; only the bridge keeps a log file.
    tether::app::LogOptions logOptions;
    logOptions.relay_debug = debugRelay;
    if (!replay && settings.log_to_file && !parser.isSet(noLogFileOption)) {
        logOptions.file_path = tether::app::default_log_file_path();
    }
    tether::app::install_logging(logOptions);

    if (replay) {
        if (positional.size() < 2) {
            QTextStream(stderr) << "usage: tether replay <file> [--json]\n";
            return 2;
        }
        return run_replay(positional.at(1), parser.isSet(jsonOption), settings);
    }

    if (!positional.isEmpty() && positional.first() != QStringLiteral("run")) {
        QTextStream(stderr) << "unknown command: " << positional.first() << QLatin1Char('\n');
        return 2;
    }

    if (!logOptions.file_path.isEmpty()) {
        qCInfo(tetherAppLog) << "logging to" << logOptions.file_path;
    }
    if (debugRelay) {
        qCInfo(tetherAppLog) << "relay debug enabled";
    }

    return run_bridge(app, settings);
}
