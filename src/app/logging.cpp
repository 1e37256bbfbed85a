#include "app/logging.hpp"

#include "sync/sync_config.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

namespace ladle::app {
namespace {

constexpr qint64 kRotateBytes = 5 * 1024 * 1024;

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

class LogSink {
public:
    void write(QtMsgType type, const char* category, const QString& message) {
        QMutexLocker lock(&mutex_);
        if (!opened_) {
            open();
        }

        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs),
                                   QString::fromLatin1(level_tag(type)),
                                   QString::fromLatin1(category ? category : "default"),
                                   message);
        if (file_.isOpen()) {
            file_.write(line.toUtf8());
            file_.flush();
        }
        // The CLI prints its results on stdout; problems go to stderr as well.
        if (type == QtWarningMsg || type == QtCriticalMsg || type == QtFatalMsg) {
            std::fputs(line.toLocal8Bit().constData(), stderr);
        }
    }

    /** False if the handler was installed before. */
    bool claim_install() {
        QMutexLocker lock(&mutex_);
        if (installed_) return false;
        installed_ = true;
        return true;
    }

private:
    void open() {
        opened_ = true;
        const auto path = default_log_file_path();
        if (!QDir().mkpath(QFileInfo(path).absolutePath())) {
            std::fprintf(stderr, "ladle: cannot create log directory for %s\n", qPrintable(path));
            return;
        }

        // One previous log is kept next to the current one.
        if (QFileInfo(path).size() > kRotateBytes) {
            const auto previous = path + QStringLiteral(".1");
            QFile::remove(previous);
            if (!QFile::rename(path, previous)) {
                std::fprintf(stderr, "ladle: cannot rotate %s\n", qPrintable(path));
            }
        }

        file_.setFileName(path);
        if (!file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::fprintf(stderr, "ladle: cannot open log file %s\n", qPrintable(path));
        }
    }

    QMutex mutex_;
    QFile file_;
    bool opened_ = false;
    bool installed_ = false;
};

LogSink& sink() {
    static LogSink instance;
    return instance;
}

void message_handler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    sink().write(type, context.category, message);
}

} // namespace

void install_file_logging() {
    if (sink().claim_install()) {
        qInstallMessageHandler(message_handler);
    }
}

QString default_log_file_path() {
    return QDir(sync::data_directory()).filePath(QStringLiteral("logs/ladle.log"));
}

} // namespace ladle::app
