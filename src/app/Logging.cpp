#include "Logging.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>
#include <QThread>

#include <cstdlib>
#include <exception>
#include <iostream>

namespace circuitsketch::app {
namespace {

struct LogState {
    QMutex mutex;
    QFile file;
    QString filePath;
    QtMessageHandler previousHandler = nullptr;
    std::terminate_handler previousTerminate = nullptr;
    bool initialized = false;
    bool debugEnabled = false;
};

LogState& state() {
    static LogState instance;
    return instance;
}

const char* levelName(QtMsgType type) {
    switch (type) {
        case QtDebugMsg:
            return "DEBUG";
        case QtInfoMsg:
            return "INFO";
        case QtWarningMsg:
            return "WARN";
        case QtCriticalMsg:
            return "ERROR";
        case QtFatalMsg:
            return "FATAL";
    }
    return "UNKNOWN";
}

bool envFlag(const char* name) {
    const QString value = qEnvironmentVariable(name).trimmed().toLower();
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

QStringList releaseDebugCategories() {
    QString configured = qEnvironmentVariable("CIRCUITSKETCH_LOG_DEBUG_CATEGORIES").trimmed();
    if (configured.isEmpty()) {
        configured = QStringLiteral("circuitsketch.main,circuitsketch.io");
    }

    QStringList categories;
    for (const QString& token : configured.split(',', Qt::SkipEmptyParts)) {
        const QString category = token.trimmed();
        if (!category.isEmpty() && !categories.contains(category)) {
            categories.push_back(category);
        }
    }
    return categories;
}

QString filterRules(bool debugEnabled) {
    QStringList rules{
        QStringLiteral("*.debug=false"),
        QStringLiteral("*.info=false"),
        QStringLiteral("default.info=true"),
        QStringLiteral("circuitsketch.*.info=true"),
        QStringLiteral("*.warning=true"),
        QStringLiteral("*.critical=true"),
    };

    if (debugEnabled) {
        rules << QStringLiteral("circuitsketch.*.debug=true");
    } else {
        for (const QString& category : releaseDebugCategories()) {
            rules << QStringLiteral("%1.debug=true").arg(category);
            rules << QStringLiteral("%1.*.debug=true").arg(category);
        }
    }
    return rules.join('\n');
}

QString formatMessage(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString location = (context.file && context.line > 0)
                                 ? QStringLiteral("%1:%2").arg(context.file).arg(context.line)
                                 : QStringLiteral("<unknown>");
    const QString function = context.function ? QString::fromUtf8(context.function)
                                               : QStringLiteral("<unknown>");
    const QString category = context.category ? QString::fromUtf8(context.category)
                                               : QStringLiteral("default");

    return QStringLiteral("%1 [%2] [tid=0x%3] [%4] [%5] [%6] %7")
        .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs),
             QString::fromLatin1(levelName(type)),
             QString::number(reinterpret_cast<quintptr>(QThread::currentThreadId()), 16),
             category,
             location,
             function,
             msg);
}

void appendToFile(const QString& line) {
    LogState& s = state();
    QMutexLocker lock(&s.mutex);
    if (s.file.isOpen()) {
        QTextStream stream(&s.file);
        stream << line << Qt::endl;
        s.file.flush();
    }
}

void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString formatted = formatMessage(type, context, msg);
    appendToFile(formatted);

    std::ostream& console = (type == QtDebugMsg || type == QtInfoMsg) ? std::cout : std::cerr;
    console << formatted.toStdString() << std::endl;

    if (type == QtFatalMsg) {
        std::abort();
    }
}

void terminateHandler() {
    const QString message =
        QStringLiteral("%1 [FATAL] [terminate] Unhandled exception triggered std::terminate")
            .arg(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    appendToFile(message);
    std::cerr << message.toStdString() << std::endl;

    if (state().previousTerminate != nullptr) {
        state().previousTerminate();
    }
    std::abort();
}

QStringList candidateDirectories() {
    QStringList paths;
    auto add = [&paths](const QString& path) {
        const QString cleaned = QDir::cleanPath(path.trimmed());
        if (!cleaned.isEmpty() && cleaned != "." && !paths.contains(cleaned)) {
            paths.push_back(cleaned);
        }
    };

    add(qEnvironmentVariable("CIRCUITSKETCH_LOG_DIR"));

    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!appData.isEmpty()) {
        add(QDir(appData).filePath(QStringLiteral("logs")));
    }
    add(QDir::current().filePath(QStringLiteral("logs")));

    const QString temp = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    if (!temp.isEmpty()) {
        add(QDir(temp).filePath(QStringLiteral("circuitsketch/logs")));
    }
    return paths;
}

/**
 * Newest first: the current run is always kept, older runs go once they are
 * past the age limit or beyond the file count limit.
 */
int pruneOldLogs(const QDir& dir, const QString& currentLogPath) {
    const QFileInfoList logs = dir.entryInfoList(QStringList{QStringLiteral("*.log")},
                                                 QDir::Files, QDir::Time);
    const QDateTime cutoff = QDateTime::currentDateTime().addDays(-Logging::kLogRetentionDays);

    int kept = 0;
    int removed = 0;
    for (const QFileInfo& info : logs) {
        const bool isCurrent = info.absoluteFilePath() == currentLogPath;
        const bool tooOld = info.lastModified().isValid() && info.lastModified() < cutoff;
        if (isCurrent || (!tooOld && kept < Logging::kMaxRunLogFiles)) {
            ++kept;
            continue;
        }
        if (QFile::remove(info.absoluteFilePath())) {
            ++removed;
        }
    }
    return removed;
}

} // namespace

bool Logging::initialize(const QString& appName, bool debugBuild) {
    LogState& s = state();
    QStringList startupWarnings;
    QString openedPath;
    QString openedDir;

    {
        QMutexLocker lock(&s.mutex);
        if (s.initialized) {
            return true;
        }

        s.debugEnabled = debugBuild || envFlag("CIRCUITSKETCH_LOG_DEBUG");
        QLoggingCategory::setFilterRules(filterRules(s.debugEnabled));

        const QString fileName =
            QStringLiteral("%1_%2_%3.log")
                .arg(appName.toLower(),
                     QDateTime::currentDateTime().toString(QStringLiteral("yyyyMMdd_HHmmss_zzz")))
                .arg(QCoreApplication::applicationPid());

        for (const QString& path : candidateDirectories()) {
            QDir dir(path);
            if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
                startupWarnings << QStringLiteral("Failed to create log directory: %1").arg(path);
                continue;
            }
            s.file.setFileName(dir.filePath(fileName));
            if (!s.file.open(QIODevice::WriteOnly | QIODevice::Text)) {
                startupWarnings << QStringLiteral("Failed to open log file: %1").arg(s.file.fileName());
                continue;
            }
            s.filePath = QFileInfo(s.file).absoluteFilePath();
            openedPath = s.filePath;
            openedDir = dir.absolutePath();
            break;
        }

        s.previousHandler = qInstallMessageHandler(messageHandler);
        s.previousTerminate = std::set_terminate(terminateHandler);
        s.initialized = true;
    }

    for (const QString& warning : startupWarnings) {
        qWarning().noquote() << warning;
    }
    if (openedPath.isEmpty()) {
        qWarning().noquote() << "File logging disabled; continuing with console-only logging";
    }

    qInfo().noquote() << "Logging initialized"
                      << "logFile=" << (openedPath.isEmpty() ? QStringLiteral("<disabled>") : openedPath)
                      << "debugBuild=" << debugBuild
                      << "debugLogsEnabled=" << s.debugEnabled;

    if (!openedPath.isEmpty()) {
        const int removed = pruneOldLogs(QDir(openedDir), openedPath);
        qInfo().noquote() << "Log retention applied"
                          << "days=" << kLogRetentionDays
                          << "maxFiles=" << kMaxRunLogFiles
                          << "removed=" << removed;
    }
    return true;
}

void Logging::shutdown() {
    LogState& s = state();
    QString closingPath;
    {
        QMutexLocker lock(&s.mutex);
        if (!s.initialized) {
            return;
        }
        closingPath = s.filePath;
    }

    qInfo().noquote() << "Logging shutdown" << "logFile=" << closingPath;

    QMutexLocker lock(&s.mutex);
    qInstallMessageHandler(s.previousHandler);
    s.previousHandler = nullptr;
    std::set_terminate(s.previousTerminate);
    s.previousTerminate = nullptr;

    if (s.file.isOpen()) {
        s.file.flush();
        s.file.close();
    }
    s.filePath.clear();
    s.initialized = false;
}

QString Logging::logFilePath() {
    QMutexLocker lock(&state().mutex);
    return state().filePath;
}

bool Logging::isDebugLoggingEnabled() {
    QMutexLocker lock(&state().mutex);
    return state().debugEnabled;
}

} // namespace circuitsketch::app
