#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>

#include "app/logging.hpp"
#include "cli/inspect.hpp"
#include "core/sync_types.hpp"
#include "sync/local_store.hpp"
#include "sync/log.hpp"
#include "sync/sync_config.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("Ladle");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Ladle");
    app.setOrganizationDomain("ladle.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect the ladle sync store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets LADLE_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption statusOption(
        QStringList{QStringLiteral("status")},
        QStringLiteral("Only list operations with this status for 'queue' (queued, in_progress, completed, failed)."),
        QStringLiteral("status"));
    parser.addOption(statusOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets LADLE_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("queue | tombstones | cleanup-tombstones | purge-completed | stats"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("LADLE_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("LADLE_DEBUG_SYNC", "1");
    }
    if (ladle::sync::sync_debug_enabled()) {
        ladle::sync::enable_sync_debug_output();
    }

    ladle::app::install_file_logging();
    qCDebug(ladleSyncLog) << "Ladle: logging to" << ladle::app::default_log_file_path();

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    ladle::cli::InspectOptions options;
    options.json = parser.isSet(jsonOption);
    if (parser.isSet(statusOption)) {
        options.status = ladle::op_status_from_string(parser.value(statusOption).toStdString());
        if (!options.status) {
            QTextStream(stderr) << "Unknown status: " << parser.value(statusOption) << QLatin1Char('\n');
            return 1;
        }
    }

    const auto dbPath = ladle::sync::database_path();
    if (!QDir().mkpath(QFileInfo(dbPath).absolutePath())) {
        QTextStream(stderr) << "Cannot create directory for " << dbPath << QLatin1Char('\n');
        return 1;
    }
    auto opened = ladle::sync::LocalStore::open(dbPath.toStdString());
    if (opened.is_err()) {
        QTextStream(stderr) << "Cannot open " << dbPath << ": "
                            << QString::fromStdString(opened.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }
    auto store = std::move(opened).unwrap();

    const auto result = ladle::cli::run_command(*store, positional.first(), options,
                                                ladle::sync::SyncConfig::load());
    if (result.is_err()) {
        QTextStream(stderr) << QString::fromStdString(result.unwrap_err().message) << QLatin1Char('\n');
        return 1;
    }

    QTextStream(stdout) << result.unwrap();
    return 0;
}
