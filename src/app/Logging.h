#ifndef CIRCUITSKETCH_APP_LOGGING_H
#define CIRCUITSKETCH_APP_LOGGING_H

#include <QString>

namespace circuitsketch::app {

/**
 * @brief Process-wide Qt message handler with a per-run log file
 *
 * Every message is written as
 *   timestamp [LEVEL] [tid=0x..] [category] [file:line] [function] text
 * to the console and to <logDir>/<app>_<timestamp>_<pid>.log. Old run logs
 * are pruned at startup.
 *
 * Environment:
 *   CIRCUITSKETCH_LOG_DEBUG=1             enable every circuitsketch.* debug category
 *   CIRCUITSKETCH_LOG_DEBUG_CATEGORIES=a,b debug categories kept on in release runs
 *   CIRCUITSKETCH_LOG_DIR=path            preferred log directory
 */
class Logging {
public:
    static bool initialize(const QString& appName, bool debugBuild);
    static void shutdown();
    static QString logFilePath();
    static bool isDebugLoggingEnabled();

    static constexpr int kLogRetentionDays = 30;
    static constexpr int kMaxRunLogFiles = 30;

private:
    Logging() = delete;
};

} // namespace circuitsketch::app

#endif // CIRCUITSKETCH_APP_LOGGING_H
