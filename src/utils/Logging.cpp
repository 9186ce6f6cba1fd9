#include "Logging.h"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>

Q_LOGGING_CATEGORY(lcBatch, "imgconv.batch")
Q_LOGGING_CATEGORY(lcCodec, "imgconv.codec")
Q_LOGGING_CATEGORY(lcConfig, "imgconv.config")
Q_LOGGING_CATEGORY(lcUi, "imgconv.ui")

namespace ImageConverter {
namespace Logging {

namespace {

// Handler state, guarded by mutex()
QFile* logFile = nullptr;
Sink sinkFn;
QtMessageHandler previousHandler = nullptr;

QMutex& mutex() {
    static QMutex m;
    return m;
}

const char* levelName(QtMsgType type) {
    switch (type) {
    case QtDebugMsg:    return "DEBUG";
    case QtInfoMsg:     return "INFO";
    case QtWarningMsg:  return "WARNING";
    case QtCriticalMsg: return "ERROR";
    case QtFatalMsg:    return "CRITICAL";
    }
    return "INFO";
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& message) {
    const QString line = formatRecord(type, context.category, message);

    Sink sink;
    {
        QMutexLocker locker(&mutex());
        if (logFile && logFile->isOpen()) {
            QTextStream out(logFile);
            out << line << '\n';
            out.flush();
        }
        if (type != QtDebugMsg) {
            std::fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
            std::fflush(stderr);
        }
        sink = sinkFn;
    }

    // Called outside the lock: the sink may log itself
    if (sink) {
        sink(type, line);
    }
}

} // namespace

QString formatRecord(QtMsgType type, const char* category, const QString& message) {
    return QString("%1 - %2 - %3 - %4")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"),
             QString::fromLatin1(category ? category : "default"),
             QString::fromLatin1(levelName(type)),
             message);
}

bool install(const QString& logDir) {
    bool fileOk = true;
    {
        QMutexLocker locker(&mutex());
        if (logFile) {
            logFile->close();
            delete logFile;
            logFile = nullptr;
        }

        if (!logDir.isEmpty()) {
            QDir dir(logDir);
            if (!dir.exists() && !dir.mkpath(".")) {
                fileOk = false;
            } else {
                const QString name = QString("converter_%1.log")
                    .arg(QDate::currentDate().toString("yyyyMMdd"));
                logFile = new QFile(dir.filePath(name));
                if (!logFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
                    delete logFile;
                    logFile = nullptr;
                    fileOk = false;
                }
            }
        }
    }

    QtMessageHandler old = qInstallMessageHandler(messageHandler);
    if (old != messageHandler) {
        previousHandler = old;
    }

    if (!fileOk) {
        qCWarning(lcConfig) << "Could not open log file in" << logDir;
    }
    return fileOk;
}

void uninstall() {
    qInstallMessageHandler(previousHandler);
    previousHandler = nullptr;

    QMutexLocker locker(&mutex());
    sinkFn = Sink();
    if (logFile) {
        logFile->close();
        delete logFile;
        logFile = nullptr;
    }
}

void setSink(Sink sink) {
    QMutexLocker locker(&mutex());
    sinkFn = std::move(sink);
}

QString currentLogFile() {
    QMutexLocker locker(&mutex());
    return logFile ? logFile->fileName() : QString();
}

} // namespace Logging
} // namespace ImageConverter
